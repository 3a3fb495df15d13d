#pragma once

#include "AudioBackend.hpp"
#include "PluginFactory.hpp"





/** Lets the device list the local audio outputs and change their volume, mute state and default.
Both the "kdeconnect." and the "cconnect." flavors of the packets are handled; each reply uses the flavor of the
request that caused it. */
class SystemVolumePlugin:
	public Plugin
{
	using Super = Plugin;

	Q_OBJECT


public:

	static const QString PACKET_TYPE_REQUEST;
	static const QString PACKET_TYPE_REQUEST_COSMIC;
	static const QString PACKET_TYPE_SINKS;
	static const QString PACKET_TYPE_SINKS_COSMIC;


	SystemVolumePlugin(
		const QString & aDeviceId,
		PacketRouter & aRouter,
		Logger & aDeviceLogger,
		std::shared_ptr<AudioBackend> aBackend
	);

	/** Returns the factory creating SystemVolumePlugin instances over the shared aBackend. */
	static PluginFactoryPtr factory(std::shared_ptr<AudioBackend> aBackend);

	/** Sends the current list of sinks to the device, using the specified packet type. */
	bool sendSinkList(const QString & aPacketType);

	// Plugin overrides:
	virtual void start() override;
	virtual void handlePacket(const Packet & aPacket) override;


protected:

	std::shared_ptr<AudioBackend> mBackend;
};
