#include "PluginRegistry.hpp"
#include "../MultiLogger.hpp"





/** Returns the sorted union of the specified capability lists. */
static QStringList sortedUnion(const QStringList & aList1, const QStringList & aList2)
{
	auto res = aList1 + aList2;
	res.removeDuplicates();
	res.sort();
	return res;
}





PluginRegistry::PluginRegistry(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("Plugins"))
{
}





void PluginRegistry::registerFactory(PluginFactoryPtr aFactory)
{
	QMutexLocker lock(&mMtx);
	for (const auto & f: mFactories)
	{
		if (f->name() == aFactory->name())
		{
			throw LogicError(mLogger, "Plugin %1 is already registered", aFactory->name());
		}
	}
	mLogger.log("Registered plugin %1 (in: %2; out: %3)",
		aFactory->name(),
		aFactory->incomingCapabilities().join(", "),
		aFactory->outgoingCapabilities().join(", ")
	);
	mFactories.push_back(aFactory);
}





std::vector<PluginFactoryPtr> PluginRegistry::factories() const
{
	QMutexLocker lock(&mMtx);
	return mFactories;
}





QStringList PluginRegistry::allIncomingCapabilities() const
{
	QStringList res;
	for (const auto & f: factories())
	{
		res = sortedUnion(res, f->incomingCapabilities());
	}
	return res;
}





QStringList PluginRegistry::allOutgoingCapabilities() const
{
	QStringList res;
	for (const auto & f: factories())
	{
		res = sortedUnion(res, f->outgoingCapabilities());
	}
	return res;
}





QStringList PluginRegistry::negotiate(
	const QStringList & aLocalIncoming,
	const QStringList & aLocalOutgoing,
	const QStringList & aPeerIncoming,
	const QStringList & aPeerOutgoing
)
{
	// Legacy peers don't announce their capabilities, assume they support everything:
	if (aPeerIncoming.isEmpty() && aPeerOutgoing.isEmpty())
	{
		return sortedUnion(aLocalIncoming, aLocalOutgoing);
	}

	QStringList res;
	for (const auto & cap: aLocalIncoming)
	{
		if (aPeerOutgoing.contains(cap))
		{
			res.append(cap);
		}
	}
	for (const auto & cap: aLocalOutgoing)
	{
		if (aPeerIncoming.contains(cap))
		{
			res.append(cap);
		}
	}
	res.removeDuplicates();
	res.sort();
	return res;
}





PluginHostPtr PluginRegistry::createHost(const DeviceIdentity & aPeerIdentity, PacketRouter & aRouter)
{
	auto negotiated = negotiate(
		allIncomingCapabilities(),
		allOutgoingCapabilities(),
		aPeerIdentity.incomingCapabilities(),
		aPeerIdentity.outgoingCapabilities()
	);
	auto & deviceLogger = mComponents.get<MultiLogger>()->deviceLogger(aPeerIdentity.deviceId());
	deviceLogger.log("Negotiated capabilities: %1", negotiated.join(", "));
	auto res = std::make_shared<PluginHost>(aPeerIdentity.deviceId(), negotiated, deviceLogger);
	for (const auto & f: factories())
	{
		if (!f->isApplicable(negotiated))
		{
			continue;
		}
		auto plugin = f->create(aPeerIdentity.deviceId(), aRouter, deviceLogger);
		if (plugin == nullptr)
		{
			mLogger.log("Plugin %1 has refused to create an instance for device %2", f->name(), aPeerIdentity.deviceId());
			continue;
		}
		res->addPlugin(plugin, f->incomingCapabilities());
	}
	return res;
}
