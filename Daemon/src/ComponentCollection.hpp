#pragma once

#include <memory>
#include <map>
#include <vector>
#include "Exception.hpp"





/** A collection of the long-lived daemon objects, so that they don't need to be pushed around in parameters.
The collection is built upon startup and is expected not to change after its initial build.
Each component receives the ComponentCollection in its constructor, so it can store it for later queries.
Once all the components are created, they are started; the order of starting is given by
the components' requests to requireForStart().

Usage:
At startup:
ComponentCollection cc;
auto db = cc.addNew<Database>();
...
cc.start();

In regular operation:
auto db = mComponents.get<Database>();
*/
class ComponentCollection
{
public:

	/** Specifies the kind of the individual component. */
	enum ComponentKind
	{
		ckInstallConfiguration,
		ckMultiLogger,        ///< The per-device and per-subsystem logger
		ckDatabase,
		ckTrustStore,         ///< Device ID -> certificate fingerprint of the paired devices
		ckPluginRegistry,     ///< All the plugin factories known to the daemon
		ckLocalIdentity,      ///< Our own device identity and TLS credentials
		ckTcpListener,
		ckConnectionMgr,      ///< The connections that haven't been handed over to DeviceMgr yet
		ckDiscovery,          ///< The UDP announce / listen loop
		ckPairingService,     ///< The per-device pairing state machines
		ckDeviceMgr,          ///< The authoritative list of devices
		ckPayloadTransfers,   ///< The payload uploads and downloads in progress
	};


protected:

	/** An internal base for all components, that keeps track of the component kind.
	Needed so that all components can be put into a container of same-type pointers. */
	class ComponentBase
	{
		friend class ::ComponentCollection;

	public:

		ComponentBase(ComponentKind aKind, ComponentCollection & aComponents):
			mKind(aKind),
			mComponents(aComponents)
		{
		}

		virtual ~ComponentBase() {}  // Force a virtual destructor in descendants

		/** Descendants override to implement the action needed for starting the component. */
		virtual void start() {}

		/** Indicates that aRequiredComponent needs to be started before this component.
		To be used only during component creation (between ComponentCollection constructor and start() call).
		Throws a LogicError if called after start(). */
		inline void requireForStart(ComponentKind aRequiredComponent)
		{
			mComponents.requireForStart(mKind, aRequiredComponent);
		}


	protected:

		/** The component's kind, stored in the base so it can be queried from the base pointer. */
		ComponentKind mKind;

		/** The component collection to which this component belongs. */
		ComponentCollection & mComponents;
	};

	using ComponentBasePtr = std::shared_ptr<ComponentBase>;


public:

	/** A base class representing the common functionality in all components in the collection. */
	template <ComponentKind tKind>
	class Component:
		public ComponentBase
	{
	public:

		Component(ComponentCollection & aComponents):
			ComponentBase(tKind, aComponents)
		{
		}

		static ComponentKind kind() { return tKind; }
	};



	/** Creates a new empty collection. */
	ComponentCollection();

	/** Adds the specified component into the collection.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass>
	void addComponent(std::shared_ptr<ComponentClass> aComponent)
	{
		addComponent(ComponentClass::kind(), aComponent);
	}


	/** Creates a new component of the specified template type,
	adds it to the collection and returns a shared ptr to it.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass, typename... Args>
	std::shared_ptr<ComponentClass> addNew(Args &&... aArgs)
	{
		auto res = std::make_shared<ComponentClass>(*this, std::forward<Args>(aArgs)...);
		addComponent(ComponentClass::kind(), res);
		return res;
	}


	/** Returns the component of the specified class.
	Throws a LogicError if there's no such component in the collection.
	Usage: auto db = mComponents.get<Database>(); */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> get()
	{
		auto res = std::dynamic_pointer_cast<ComponentClass>(get(ComponentClass::kind()));
		if (res == nullptr)
		{
			throw LogicError("Component of kind %1 has an unexpected class", ComponentClass::kind());
		}
		return res;
	}

	/** Returns true if a component of the specified kind is present in the collection. */
	bool has(ComponentKind aKind) const;

	/** Starts all the components, in a topological order. */
	void start();

	/** Returns the logger for the specified subsystem name.
	The MultiLogger component must already be in the collection. */
	Logger & logger(const QString & aName);

	/** Logs directly to the specified logger. */
	template <typename... T>
	void log(const QString & aLoggerName, const QString & aFormatString, const T &... aArgs)
	{
		logger(aLoggerName).log(aFormatString, aArgs...);
	}


protected:

	/** The collection of all components. */
	std::map<ComponentKind, ComponentBasePtr> mComponents;

	/** The requirements for starting the individual components.
	Map of ComponentKind (to be started) -> vector of ComponentKind (needs to be already running). */
	std::map<ComponentKind, std::vector<ComponentKind>> mStartRequirements;

	/** Indicates whether start() has been called. */
	bool mIsStarted;


	/** Adds the specified component into the collection.
	Client code should use the templated version, this is its actual implementation. */
	void addComponent(ComponentKind aKind, ComponentBasePtr aComponent);

	/** Returns the component of the specified kind, as a base pointer.
	Throws a LogicError if not present. Clients should use the templated get() instead. */
	ComponentBasePtr get(ComponentKind aKind);

	/** Requests that aRequiredComponent be started before aThisComponent.
	Throws a LogicError if called after start(). */
	void requireForStart(ComponentKind aThisComponent, ComponentKind aRequiredComponent);

	/** Returns the mComponents in the order in which they should be started.
	Components that are required but not present in the collection are ignored.
	Throws a LogicError if the start order cannot be constructed (due to cycles). */
	std::vector<ComponentBasePtr> componentsInStartOrder();
};
