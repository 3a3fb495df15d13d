#include "SystemVolumePlugin.hpp"
#include <QJsonArray>





const QString SystemVolumePlugin::PACKET_TYPE_REQUEST        = "kdeconnect.systemvolume.request";
const QString SystemVolumePlugin::PACKET_TYPE_REQUEST_COSMIC = "cconnect.systemvolume.request";
const QString SystemVolumePlugin::PACKET_TYPE_SINKS          = "kdeconnect.systemvolume";
const QString SystemVolumePlugin::PACKET_TYPE_SINKS_COSMIC   = "cconnect.systemvolume";





SystemVolumePlugin::SystemVolumePlugin(
	const QString & aDeviceId,
	PacketRouter & aRouter,
	Logger & aDeviceLogger,
	std::shared_ptr<AudioBackend> aBackend
):
	Super("systemvolume", aDeviceId, aRouter, aDeviceLogger),
	mBackend(aBackend)
{
}





PluginFactoryPtr SystemVolumePlugin::factory(std::shared_ptr<AudioBackend> aBackend)
{
	return std::make_shared<PluginFactory>(
		"systemvolume",
		QStringList{PACKET_TYPE_REQUEST_COSMIC, PACKET_TYPE_REQUEST},
		QStringList{PACKET_TYPE_SINKS_COSMIC, PACKET_TYPE_SINKS},
		[aBackend](const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)
		{
			return std::make_shared<SystemVolumePlugin>(aDeviceId, aRouter, aDeviceLogger, aBackend);
		}
	);
}





bool SystemVolumePlugin::sendSinkList(const QString & aPacketType)
{
	QJsonArray list;
	for (const auto & sink: mBackend->sinks())
	{
		QJsonObject obj;
		obj.insert("name",        sink.mName);
		obj.insert("description", sink.mDescription);
		obj.insert("volume",      sink.mVolume);
		obj.insert("muted",       sink.mMuted);
		obj.insert("maxVolume",   sink.mMaxVolume);
		obj.insert("enabled",     sink.mEnabled);
		list.append(obj);
	}
	mLogger.log("Sending %1 sinks", list.size());
	QJsonObject body;
	body.insert("sinkList", list);
	return sendPacket(Packet(aPacketType, body));
}





void SystemVolumePlugin::start()
{
	sendSinkList(PACKET_TYPE_SINKS);
}





void SystemVolumePlugin::handlePacket(const Packet & aPacket)
{
	QString replyType;
	if (aPacket.type() == PACKET_TYPE_REQUEST)
	{
		replyType = PACKET_TYPE_SINKS;
	}
	else if (aPacket.type() == PACKET_TYPE_REQUEST_COSMIC)
	{
		replyType = PACKET_TYPE_SINKS_COSMIC;
	}
	else
	{
		throw PluginError("Unexpected packet type: %1", aPacket.type());
	}

	if (aPacket.bodyBool("requestSinks"))
	{
		mLogger.log("The device requests the sink list");
		sendSinkList(replyType);
		return;
	}

	auto sinkName = aPacket.bodyString("name");
	if (sinkName.isEmpty())
	{
		sinkName = mBackend->defaultSinkName();
	}
	if (sinkName.isEmpty())
	{
		mLogger.log("No sink specified and there's no default sink, ignoring the request");
		return;
	}

	if (aPacket.bodyContains("volume"))
	{
		auto volume = static_cast<int>(aPacket.bodyInt("volume"));
		mLogger.log("Setting volume of sink %1 to %2", sinkName, volume);
		if (!mBackend->setVolume(sinkName, volume))
		{
			mLogger.log("Failed to set the volume of sink %1", sinkName);
		}
	}
	if (aPacket.bodyContains("muted"))
	{
		auto muted = aPacket.bodyBool("muted");
		mLogger.log("Setting mute of sink %1 to %2", sinkName, muted);
		if (!mBackend->setMuted(sinkName, muted))
		{
			mLogger.log("Failed to set the mute of sink %1", sinkName);
		}
	}
	if (aPacket.bodyBool("enabled"))
	{
		mLogger.log("Making sink %1 the default", sinkName);
		if (!mBackend->setDefault(sinkName))
		{
			mLogger.log("Failed to make sink %1 the default", sinkName);
		}
	}

	// Report the resulting state back:
	sendSinkList(replyType);
}
