#include "RemoteInputPlugin.hpp"





const QString RemoteInputPlugin::PACKET_TYPE_REQUEST       = "kdeconnect.mousepad.request";
const QString RemoteInputPlugin::PACKET_TYPE_ECHO          = "kdeconnect.mousepad.echo";
const QString RemoteInputPlugin::PACKET_TYPE_KEYBOARDSTATE = "kdeconnect.mousepad.keyboardstate";





RemoteInputPlugin::RemoteInputPlugin(
	const QString & aDeviceId,
	PacketRouter & aRouter,
	Logger & aDeviceLogger,
	std::shared_ptr<InputSink> aSink
):
	Super("remoteinput", aDeviceId, aRouter, aDeviceLogger),
	mSink(aSink)
{
}





PluginFactoryPtr RemoteInputPlugin::factory(std::shared_ptr<InputSink> aSink)
{
	return std::make_shared<PluginFactory>(
		"remoteinput",
		QStringList{PACKET_TYPE_REQUEST},
		QStringList{PACKET_TYPE_KEYBOARDSTATE, PACKET_TYPE_ECHO},
		[aSink](const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)
		{
			return std::make_shared<RemoteInputPlugin>(aDeviceId, aRouter, aDeviceLogger, aSink);
		}
	);
}





void RemoteInputPlugin::start()
{
	QJsonObject body;
	body.insert("state", true);
	sendPacket(Packet(PACKET_TYPE_KEYBOARDSTATE, body));
}





void RemoteInputPlugin::handlePacket(const Packet & aPacket)
{
	if (aPacket.type() != PACKET_TYPE_REQUEST)
	{
		throw PluginError("Unexpected packet type: %1", aPacket.type());
	}
	processRequest(aPacket);

	if (aPacket.bodyBool("sendAck"))
	{
		auto body = aPacket.body();
		body.remove("sendAck");
		body.insert("isAck", true);
		sendPacket(Packet(PACKET_TYPE_ECHO, body));
	}
}





void RemoteInputPlugin::processRequest(const Packet & aPacket)
{
	if (mSink == nullptr)
	{
		throw PluginError("No input sink available");
	}

	// Pointer movement and scrolling:
	if (aPacket.bodyContains("dx") || aPacket.bodyContains("dy"))
	{
		auto dx = aPacket.bodyDouble("dx");
		auto dy = aPacket.bodyDouble("dy");
		if (aPacket.bodyBool("scroll"))
		{
			mSink->scroll(dx, dy);
		}
		else
		{
			mSink->movePointer(dx, dy);
		}
	}

	// Buttons:
	if (aPacket.bodyBool("singleclick"))
	{
		mSink->click(InputSink::mbLeft);
	}
	if (aPacket.bodyBool("doubleclick"))
	{
		mSink->doubleClick();
	}
	if (aPacket.bodyBool("middleclick"))
	{
		mSink->click(InputSink::mbMiddle);
	}
	if (aPacket.bodyBool("rightclick"))
	{
		mSink->click(InputSink::mbRight);
	}
	if (aPacket.bodyBool("singlehold"))
	{
		mSink->pressButton(InputSink::mbLeft);
	}
	if (aPacket.bodyBool("singlerelease"))
	{
		mSink->releaseButton(InputSink::mbLeft);
	}

	// Keyboard:
	InputSink::Modifiers mods;
	mods.mAlt   = aPacket.bodyBool("alt");
	mods.mCtrl  = aPacket.bodyBool("ctrl");
	mods.mShift = aPacket.bodyBool("shift");
	mods.mSuper = aPacket.bodyBool("super");
	auto key = aPacket.bodyString("key");
	if (!key.isEmpty())
	{
		mSink->typeText(key, mods);
	}
	auto specialKey = static_cast<int>(aPacket.bodyInt("specialKey"));
	if (specialKey != InputSink::skNone)
	{
		mSink->pressSpecialKey(specialKey, mods);
	}
}
