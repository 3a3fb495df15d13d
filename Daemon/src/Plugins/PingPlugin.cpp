#include "PingPlugin.hpp"





const QString PingPlugin::PACKET_TYPE = "kdeconnect.ping";





PingPlugin::PingPlugin(const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger):
	Super("ping", aDeviceId, aRouter, aDeviceLogger),
	mNumReceived(0)
{
}





PluginFactoryPtr PingPlugin::factory()
{
	return std::make_shared<PluginFactory>(
		"ping",
		QStringList{PACKET_TYPE},
		QStringList{PACKET_TYPE},
		[](const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)
		{
			return std::make_shared<PingPlugin>(aDeviceId, aRouter, aDeviceLogger);
		}
	);
}





bool PingPlugin::sendPing(const QString & aMessage)
{
	QJsonObject body;
	if (!aMessage.isEmpty())
	{
		body.insert("message", aMessage);
	}
	return sendPacket(Packet(PACKET_TYPE, body));
}





void PingPlugin::handlePacket(const Packet & aPacket)
{
	mNumReceived += 1;
	mLastMessage = aPacket.bodyString("message");
	if (mLastMessage.isEmpty())
	{
		mLogger.log("Ping received (%1 total)", mNumReceived);
	}
	else
	{
		mLogger.log("Ping received (%1 total): %2", mNumReceived, mLastMessage);
	}
	emit pingReceived(mDeviceId, mLastMessage);
}
