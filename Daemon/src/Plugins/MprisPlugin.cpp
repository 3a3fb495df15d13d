#include "MprisPlugin.hpp"
#include <algorithm>
#include <QJsonArray>





const QString MprisPlugin::PACKET_TYPE_REQUEST = "kdeconnect.mpris.request";
const QString MprisPlugin::PACKET_TYPE_STATE   = "kdeconnect.mpris";





MprisPlugin::MprisPlugin(
	const QString & aDeviceId,
	PacketRouter & aRouter,
	Logger & aDeviceLogger,
	std::shared_ptr<MediaPlayerBackend> aBackend
):
	Super("mpris", aDeviceId, aRouter, aDeviceLogger),
	mBackend(aBackend)
{
}





PluginFactoryPtr MprisPlugin::factory(std::shared_ptr<MediaPlayerBackend> aBackend)
{
	return std::make_shared<PluginFactory>(
		"mpris",
		QStringList{PACKET_TYPE_REQUEST},
		QStringList{PACKET_TYPE_STATE},
		[aBackend](const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)
		{
			return std::make_shared<MprisPlugin>(aDeviceId, aRouter, aDeviceLogger, aBackend);
		}
	);
}





bool MprisPlugin::isValidAction(const QString & aAction)
{
	static const QStringList actions = {"Play", "Pause", "PlayPause", "Stop", "Next", "Previous"};
	return actions.contains(aAction);
}





void MprisPlugin::start()
{
	mConnPlayerListChanged = connect(
		mBackend.get(), &MediaPlayerBackend::playerListChanged,
		this,           &MprisPlugin::sendPlayerList
	);
	mConnPlayerStateChanged = connect(
		mBackend.get(), &MediaPlayerBackend::playerStateChanged,
		this,           &MprisPlugin::sendPlayerState
	);
}





void MprisPlugin::stop()
{
	disconnect(mConnPlayerListChanged);
	disconnect(mConnPlayerStateChanged);
}





void MprisPlugin::handlePacket(const Packet & aPacket)
{
	if (aPacket.type() != PACKET_TYPE_REQUEST)
	{
		throw PluginError("Unexpected packet type: %1", aPacket.type());
	}
	if (aPacket.bodyBool("requestPlayerList"))
	{
		sendPlayerList();
	}

	auto player = aPacket.bodyString("player");
	if (player.isEmpty())
	{
		return;
	}
	if (!mBackend->players().contains(player))
	{
		throw PluginError("Unknown player: %1", player);
	}
	processControl(player, aPacket);
	if (aPacket.bodyBool("requestNowPlaying") || aPacket.bodyBool("requestVolume"))
	{
		sendPlayerState(player);
	}
}





void MprisPlugin::processControl(const QString & aPlayer, const Packet & aPacket)
{
	auto action = aPacket.bodyString("action");
	if (!action.isEmpty())
	{
		if (!isValidAction(action))
		{
			throw PluginError("Unknown player action: %1", action);
		}
		mLogger.log("Player %1: %2", aPlayer, action);
		if (!mBackend->performAction(aPlayer, action))
		{
			mLogger.log("Player %1 has failed to perform %2", aPlayer, action);
		}
	}
	if (aPacket.bodyContains("setVolume"))
	{
		auto volume = static_cast<int>(aPacket.bodyInt("setVolume"));
		if (!mBackend->setVolume(aPlayer, std::max(0, std::min(100, volume))))
		{
			mLogger.log("Player %1 has failed to set volume %2", aPlayer, volume);
		}
	}
	if (aPacket.bodyContains("Seek"))
	{
		auto offset = aPacket.bodyInt("Seek");
		if (!mBackend->seek(aPlayer, offset))
		{
			mLogger.log("Player %1 has failed to seek by %2 usec", aPlayer, offset);
		}
	}
	if (aPacket.bodyContains("SetPosition"))
	{
		auto position = aPacket.bodyInt("SetPosition");
		if (!mBackend->setPosition(aPlayer, position))
		{
			mLogger.log("Player %1 has failed to set position %2 msec", aPlayer, position);
		}
	}
	if (aPacket.bodyContains("setLoopStatus"))
	{
		auto loopStatus = aPacket.bodyString("setLoopStatus");
		if ((loopStatus != "None") && (loopStatus != "Track") && (loopStatus != "Playlist"))
		{
			throw PluginError("Unknown loop status: %1", loopStatus);
		}
		if (!mBackend->setLoopStatus(aPlayer, loopStatus))
		{
			mLogger.log("Player %1 has failed to set loop status %2", aPlayer, loopStatus);
		}
	}
	if (aPacket.bodyContains("setShuffle"))
	{
		auto shuffle = aPacket.bodyBool("setShuffle");
		if (!mBackend->setShuffle(aPlayer, shuffle))
		{
			mLogger.log("Player %1 has failed to set shuffle %2", aPlayer, shuffle);
		}
	}
}





void MprisPlugin::sendPlayerList()
{
	QJsonObject body;
	body.insert("playerList", QJsonArray::fromStringList(mBackend->players()));
	body.insert("supportAlbumArtPayload", false);
	sendPacket(Packet(PACKET_TYPE_STATE, body));
}





void MprisPlugin::sendPlayerState(const QString & aPlayer)
{
	auto state = mBackend->playerState(aPlayer);
	if (!state.isPresent())
	{
		mLogger.log("Player %1 has disappeared, sending the player list instead", aPlayer);
		sendPlayerList();
		return;
	}
	const auto & s = state.value();
	QJsonObject body;
	body.insert("player",        aPlayer);
	body.insert("isPlaying",     s.mIsPlaying);
	body.insert("pos",           static_cast<double>(s.mPosition));
	body.insert("length",        static_cast<double>(s.mLength));
	body.insert("volume",        s.mVolume);
	body.insert("title",         s.mTitle);
	body.insert("artist",        s.mArtist);
	body.insert("album",         s.mAlbum);
	body.insert("loopStatus",    s.mLoopStatus);
	body.insert("shuffle",       s.mShuffle);
	body.insert("canPlay",       s.mCanPlay);
	body.insert("canPause",      s.mCanPause);
	body.insert("canGoNext",     s.mCanGoNext);
	body.insert("canGoPrevious", s.mCanGoPrevious);
	body.insert("canSeek",       s.mCanSeek);
	sendPacket(Packet(PACKET_TYPE_STATE, body));
}
