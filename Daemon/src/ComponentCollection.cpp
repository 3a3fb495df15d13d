#include "ComponentCollection.hpp"
#include <set>
#include "MultiLogger.hpp"





ComponentCollection::ComponentCollection():
	mIsStarted(false)
{
}





bool ComponentCollection::has(ComponentCollection::ComponentKind aKind) const
{
	return (mComponents.find(aKind) != mComponents.end());
}





void ComponentCollection::start()
{
	if (mIsStarted)
	{
		throw LogicError("The ComponentCollection is already started.");
	}
	auto order = componentsInStartOrder();
	mIsStarted = true;
	for (const auto & component: order)
	{
		component->start();
	}
}





Logger & ComponentCollection::logger(const QString & aName)
{
	return get<MultiLogger>()->logger(aName);
}





void ComponentCollection::addComponent(
	ComponentCollection::ComponentKind aKind,
	ComponentCollection::ComponentBasePtr aComponent
)
{
	if (has(aKind))
	{
		throw LogicError("Duplicate component in collection: %1", aKind);
	}
	mComponents[aKind] = aComponent;
}





ComponentCollection::ComponentBasePtr ComponentCollection::get(ComponentCollection::ComponentKind aKind)
{
	auto itr = mComponents.find(aKind);
	if (itr == mComponents.end())
	{
		throw LogicError("Component not present in the collection: %1", aKind);
	}
	return itr->second;
}




void ComponentCollection::requireForStart(
	ComponentCollection::ComponentKind aThisComponent,
	ComponentCollection::ComponentKind aRequiredComponent
)
{
	if (mIsStarted)
	{
		throw LogicError("The ComponentCollection is already started.");
	}
	if (aThisComponent == aRequiredComponent)
	{
		throw LogicError("Component %1 cannot require itself", aThisComponent);
	}
	mStartRequirements[aThisComponent].push_back(aRequiredComponent);
}





std::vector<ComponentCollection::ComponentBasePtr> ComponentCollection::componentsInStartOrder()
{
	std::vector<ComponentBasePtr> res;
	std::set<ComponentKind> started;
	while (res.size() < mComponents.size())
	{
		bool hasAdded = false;
		for (const auto & componentPair: mComponents)
		{
			auto kind = componentPair.first;
			if (started.find(kind) != started.end())
			{
				continue;
			}

			// The component can start once all its present requirements have started:
			bool canAdd = true;
			for (const auto req: mStartRequirements[kind])
			{
				if (has(req) && (started.find(req) == started.end()))
				{
					canAdd = false;
					break;
				}
			}
			if (!canAdd)
			{
				continue;
			}

			res.push_back(componentPair.second);
			started.insert(kind);
			hasAdded = true;
		}
		if (!hasAdded)
		{
			throw LogicError("Failed to calculate component start order, there's a dependency cycle");
		}
	}
	return res;
}
