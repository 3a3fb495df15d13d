#pragma once

#include <map>
#include <memory>
#include <vector>
#include <QStringList>
#include "Plugin.hpp"





/** Owns the plugin instances of a single paired device and dispatches the device's packets to them.
The dispatch map (packet type -> plugins, in the order of addition) is built as the plugins are added,
from the negotiated capabilities only; it doesn't change once the host is started.
A packet goes to every plugin that claims its type; an exception thrown by one plugin is logged
and doesn't prevent the other plugins from receiving the packet. */
class PluginHost
{
public:

	/** Creates an empty host for the specified device and negotiated capability set.
	aLogger is the device's logger. */
	PluginHost(const QString & aDeviceId, const QStringList & aNegotiatedCapabilities, Logger & aLogger);

	/** Stops the plugins, if not stopped already. */
	~PluginHost();

	/** Adds the plugin and registers it for those of aIncomingCapabilities that were negotiated.
	Throws a LogicError if the host is already started. */
	void addPlugin(PluginPtr aPlugin, const QStringList & aIncomingCapabilities);

	/** Calls init() and start() on all the plugins, in the order of addition.
	A plugin that throws is logged and removed. */
	void start();

	/** Calls stop() on all the plugins. No more packets are dispatched afterwards. */
	void stop();

	/** Delivers the packet to all the plugins registered for its type.
	Returns the number of plugins that have received the packet (including those that failed on it).
	Packets of unclaimed types are dropped with a debug notice. */
	size_t dispatch(const Packet & aPacket);

	// Simple getters:
	const QString & deviceId() const { return mDeviceId; }
	const QStringList & negotiatedCapabilities() const { return mNegotiatedCapabilities; }
	const std::vector<PluginPtr> & plugins() const { return mPlugins; }
	bool isStarted() const { return mIsStarted; }

	/** Returns the plugin of the specified name, or nullptr if there's none. */
	PluginPtr plugin(const QString & aName) const;

	/** Returns the plugin of the specified class, or nullptr if there's none.
	Usage: auto ping = host->plugin<PingPlugin>(); */
	template <typename PluginClass>
	std::shared_ptr<PluginClass> plugin() const
	{
		for (const auto & p: mPlugins)
		{
			auto res = std::dynamic_pointer_cast<PluginClass>(p);
			if (res != nullptr)
			{
				return res;
			}
		}
		return nullptr;
	}


protected:

	QString mDeviceId;

	QStringList mNegotiatedCapabilities;

	/** All the plugins, in the order of addition. */
	std::vector<PluginPtr> mPlugins;

	/** Packet type -> plugins that handle it. */
	std::map<QString, std::vector<PluginPtr>> mDispatchMap;

	bool mIsStarted;
	bool mIsStopped;

	Logger & mLogger;


	/** Removes the plugin from mPlugins and from mDispatchMap. */
	void removePlugin(const PluginPtr & aPlugin);
};

using PluginHostPtr = std::shared_ptr<PluginHost>;
