#pragma once

#include <memory>
#include <QObject>
#include "../Exception.hpp"
#include "../Logger.hpp"
#include "../Packet.hpp"
#include "PacketRouter.hpp"





/** The base for a single feature of a single paired device.
Each paired device gets its own instances of all the applicable plugins (created by PluginFactory), so no
per-device state is ever shared. The PluginHost calls init() and start() after creating the plugin, feeds it the
packets of its incoming capabilities through handlePacket() and calls stop() when the device is no longer paired
or connected. Plugins send their packets through the PacketRouter, at any time. */
class Plugin:
	public QObject
{
	using Super = QObject;

	Q_OBJECT


public:

	/** Thrown from handlePacket() when the plugin cannot process the packet.
	The PluginHost logs it; neither the connection nor the other plugins are affected. */
	class PluginError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Creates a new instance of the named plugin, bound to the specified device.
	The log messages are written into aDeviceLogger, prefixed by the plugin name. */
	Plugin(const QString & aName, const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger);

	virtual ~Plugin() override {}

	// Simple getters:
	const QString & name() const { return mName; }
	const QString & deviceId() const { return mDeviceId; }

	/** Called once after the plugin is created, before any packet is delivered. */
	virtual void init() {}

	/** Called after init(). The plugin may start sending packets. */
	virtual void start() {}

	/** Called before the plugin is destroyed. No packets are delivered after this. */
	virtual void stop() {}

	/** Processes a packet received from the device.
	Only packets whose type is among the plugin's negotiated incoming capabilities are delivered.
	May throw a PluginError (or any other std::exception), which is logged by the host. */
	virtual void handlePacket(const Packet & aPacket) = 0;


protected:

	QString mName;

	/** The device to which this instance belongs. */
	QString mDeviceId;

	/** The outbound channel for this plugin's packets. */
	PacketRouter & mRouter;

	PrefixLogger mLogger;


	/** Sends the packet to mDeviceId through mRouter.
	Logs the packets that couldn't be sent and returns false for them. */
	bool sendPacket(const Packet & aPacket);
};

using PluginPtr = std::shared_ptr<Plugin>;
