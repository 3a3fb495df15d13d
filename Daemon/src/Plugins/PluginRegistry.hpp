#pragma once

#include <memory>
#include <vector>
#include <QMutex>
#include <QStringList>
#include "../ComponentCollection.hpp"
#include "../DeviceIdentity.hpp"
#include "PluginFactory.hpp"
#include "PluginHost.hpp"





/** All the plugin kinds known to the daemon.
The factories are registered at startup, before the collection is started; the union of their capabilities
is announced in our identity. For each paired device, createHost() negotiates the capabilities with the
device and instantiates the applicable plugins. */
class PluginRegistry:
	public ComponentCollection::Component<ComponentCollection::ckPluginRegistry>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckPluginRegistry>;


public:

	explicit PluginRegistry(ComponentCollection & aComponents);

	/** Adds the factory to the registry.
	Throws a LogicError if a factory of the same name is already registered. */
	void registerFactory(PluginFactoryPtr aFactory);

	/** Returns all the registered factories, in the order of registration. */
	std::vector<PluginFactoryPtr> factories() const;

	/** Returns the union of the incoming capabilities of all the factories, sorted. */
	QStringList allIncomingCapabilities() const;

	/** Returns the union of the outgoing capabilities of all the factories, sorted. */
	QStringList allOutgoingCapabilities() const;

	/** Returns the capabilities negotiated between us and the peer:
	(local incoming & peer outgoing) | (local outgoing & peer incoming).
	If the peer has announced no capabilities at all, all the local capabilities are negotiated. */
	static QStringList negotiate(
		const QStringList & aLocalIncoming,
		const QStringList & aLocalOutgoing,
		const QStringList & aPeerIncoming,
		const QStringList & aPeerOutgoing
	);

	/** Creates the (not yet started) plugin host for the specified paired device.
	Only the plugins having at least one negotiated capability are instantiated. */
	PluginHostPtr createHost(const DeviceIdentity & aPeerIdentity, PacketRouter & aRouter);


protected:

	std::vector<PluginFactoryPtr> mFactories;

	/** Protects mFactories against multithreaded access. */
	mutable QMutex mMtx;

	Logger & mLogger;
};
