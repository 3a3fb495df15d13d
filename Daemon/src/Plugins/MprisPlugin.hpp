#pragma once

#include <QMetaObject>
#include "MediaPlayerBackend.hpp"
#include "PluginFactory.hpp"





/** Lets the device see and control the local media players.
Answers the player list and now-playing requests, performs the control requests, and pushes the player list
and the player states to the device whenever the backend reports a change. */
class MprisPlugin:
	public Plugin
{
	using Super = Plugin;

	Q_OBJECT


public:

	static const QString PACKET_TYPE_REQUEST;
	static const QString PACKET_TYPE_STATE;


	MprisPlugin(
		const QString & aDeviceId,
		PacketRouter & aRouter,
		Logger & aDeviceLogger,
		std::shared_ptr<MediaPlayerBackend> aBackend
	);

	/** Returns the factory creating MprisPlugin instances over the shared aBackend. */
	static PluginFactoryPtr factory(std::shared_ptr<MediaPlayerBackend> aBackend);

	/** Returns true if the action is one of the actions understood by the players. */
	static bool isValidAction(const QString & aAction);

	// Plugin overrides:
	virtual void start() override;
	virtual void stop() override;
	virtual void handlePacket(const Packet & aPacket) override;


protected:

	std::shared_ptr<MediaPlayerBackend> mBackend;

	/** The connections to mBackend's signals, disconnected in stop(). */
	QMetaObject::Connection mConnPlayerListChanged;
	QMetaObject::Connection mConnPlayerStateChanged;


	/** Processes the control parts of the request (action, volume, position, loop, shuffle). */
	void processControl(const QString & aPlayer, const Packet & aPacket);


public slots:

	/** Sends the list of players to the device. */
	void sendPlayerList();

	/** Sends the state of the specified player to the device. */
	void sendPlayerState(const QString & aPlayer);
};
