#pragma once

#include "PluginFactory.hpp"





/** Answers nothing, only logs and counts the pings; sendPing() pings the device. */
class PingPlugin:
	public Plugin
{
	using Super = Plugin;

	Q_OBJECT


public:

	static const QString PACKET_TYPE;


	PingPlugin(const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger);

	/** Returns the factory creating PingPlugin instances. */
	static PluginFactoryPtr factory();

	/** Sends a ping to the device, with an optional message. */
	bool sendPing(const QString & aMessage = QString());

	/** Returns the number of pings received from the device. */
	int numReceived() const { return mNumReceived; }

	/** Returns the message of the last received ping (empty if none). */
	const QString & lastMessage() const { return mLastMessage; }

	// Plugin override:
	virtual void handlePacket(const Packet & aPacket) override;


protected:

	int mNumReceived;
	QString mLastMessage;


signals:

	/** Emitted for each received ping. */
	void pingReceived(const QString & aDeviceId, const QString & aMessage);
};
