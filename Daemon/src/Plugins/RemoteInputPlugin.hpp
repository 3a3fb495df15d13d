#pragma once

#include "InputSink.hpp"
#include "PluginFactory.hpp"





/** Lets the device control the local pointer and keyboard (the "mousepad" feature).
The requests are translated into InputSink calls. On start, the plugin tells the device that a keyboard is
available; requests with "sendAck" are echoed back with "isAck" set. */
class RemoteInputPlugin:
	public Plugin
{
	using Super = Plugin;

	Q_OBJECT


public:

	static const QString PACKET_TYPE_REQUEST;
	static const QString PACKET_TYPE_ECHO;
	static const QString PACKET_TYPE_KEYBOARDSTATE;


	RemoteInputPlugin(
		const QString & aDeviceId,
		PacketRouter & aRouter,
		Logger & aDeviceLogger,
		std::shared_ptr<InputSink> aSink
	);

	/** Returns the factory creating RemoteInputPlugin instances, all of them injecting into aSink. */
	static PluginFactoryPtr factory(std::shared_ptr<InputSink> aSink);

	// Plugin overrides:
	virtual void start() override;
	virtual void handlePacket(const Packet & aPacket) override;


protected:

	std::shared_ptr<InputSink> mSink;


	/** Translates a single mousepad request into the InputSink calls. */
	void processRequest(const Packet & aPacket);
};
