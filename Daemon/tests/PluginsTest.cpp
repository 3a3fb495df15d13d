#include <vector>
#include <QBuffer>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <gtest/gtest.h>
#include "Payload/PayloadDownload.hpp"
#include "Plugins/MprisPlugin.hpp"
#include "Plugins/RemoteInputPlugin.hpp"
#include "Plugins/SharePlugin.hpp"
#include "Plugins/SystemVolumePlugin.hpp"
#include "TestHelpers.hpp"





/** An InputSink recording the events as strings. */
class RecordingInputSink:
	public InputSink
{
public:

	std::vector<QString> mEvents;

	virtual void movePointer(double aDx, double aDy) override { mEvents.push_back(QString("move %1 %2").arg(aDx).arg(aDy)); }
	virtual void scroll(double aDx, double aDy) override { mEvents.push_back(QString("scroll %1 %2").arg(aDx).arg(aDy)); }
	virtual void click(MouseButton aButton) override { mEvents.push_back(QString("click %1").arg(aButton)); }
	virtual void doubleClick() override { mEvents.push_back("doubleclick"); }
	virtual void pressButton(MouseButton aButton) override { mEvents.push_back(QString("press %1").arg(aButton)); }
	virtual void releaseButton(MouseButton aButton) override { mEvents.push_back(QString("release %1").arg(aButton)); }
	virtual void typeText(const QString & aText, const Modifiers & aModifiers) override
	{
		mEvents.push_back("type " + modifiersToString(aModifiers) + aText);
	}
	virtual void pressSpecialKey(int aSpecialKey, const Modifiers & aModifiers) override
	{
		mEvents.push_back("key " + modifiersToString(aModifiers) + specialKeyName(aSpecialKey));
	}
};





/** An AudioBackend with two sinks kept in memory. */
class MemoryAudioBackend:
	public AudioBackend
{
public:

	std::vector<Sink> mSinks;
	QString mDefault;

	MemoryAudioBackend()
	{
		mSinks.push_back(Sink{"speakers", "Speakers", 50, false, 100, true});
		mSinks.push_back(Sink{"hdmi", "HDMI", 80, true, 100, false});
		mDefault = "speakers";
	}

	virtual std::vector<Sink> sinks() override { return mSinks; }
	virtual QString defaultSinkName() override { return mDefault; }

	virtual bool setVolume(const QString & aSinkName, int aVolume) override
	{
		auto sink = find(aSinkName);
		if (sink == nullptr)
		{
			return false;
		}
		sink->mVolume = aVolume;
		return true;
	}

	virtual bool setMuted(const QString & aSinkName, bool aMuted) override
	{
		auto sink = find(aSinkName);
		if (sink == nullptr)
		{
			return false;
		}
		sink->mMuted = aMuted;
		return true;
	}

	virtual bool setDefault(const QString & aSinkName) override
	{
		if (find(aSinkName) == nullptr)
		{
			return false;
		}
		for (auto & s: mSinks)
		{
			s.mEnabled = (s.mName == aSinkName);
		}
		mDefault = aSinkName;
		return true;
	}

	Sink * find(const QString & aSinkName)
	{
		for (auto & s: mSinks)
		{
			if (s.mName == aSinkName)
			{
				return &s;
			}
		}
		return nullptr;
	}
};





/** A MediaPlayerBackend with a single player "vlc". */
class MemoryMediaPlayerBackend:
	public MediaPlayerBackend
{
public:

	PlayerState mState;
	std::vector<QString> mActions;

	MemoryMediaPlayerBackend()
	{
		mState.mTitle = "Song";
		mState.mArtist = "Artist";
		mState.mLength = 180000;
	}

	virtual QStringList players() override { return {"vlc"}; }

	virtual Optional<PlayerState> playerState(const QString & aPlayer) override
	{
		if (aPlayer != "vlc")
		{
			return {};
		}
		return mState;
	}

	virtual bool performAction(const QString & aPlayer, const QString & aAction) override
	{
		mActions.push_back(aPlayer + ":" + aAction);
		if (aAction == "Play")
		{
			mState.mIsPlaying = true;
		}
		return true;
	}

	virtual bool setVolume(const QString & aPlayer, int aVolume) override { Q_UNUSED(aPlayer); mState.mVolume = aVolume; return true; }
	virtual bool seek(const QString & aPlayer, qint64 aOffsetUsec) override { Q_UNUSED(aPlayer); mState.mPosition += aOffsetUsec / 1000; return true; }
	virtual bool setPosition(const QString & aPlayer, qint64 aPositionMsec) override { Q_UNUSED(aPlayer); mState.mPosition = aPositionMsec; return true; }
	virtual bool setLoopStatus(const QString & aPlayer, const QString & aLoopStatus) override { Q_UNUSED(aPlayer); mState.mLoopStatus = aLoopStatus; return true; }
	virtual bool setShuffle(const QString & aPlayer, bool aShuffle) override { Q_UNUSED(aPlayer); mState.mShuffle = aShuffle; return true; }
};





class PluginsTest:
	public ComponentsTest
{
protected:

	RecordingRouter mRouter;


	PluginsTest():
		mRouter(logger("Router"))
	{
	}

	Logger & deviceLogger() { return logger("Device-dev"); }
};





////////////////////////////////////////////////////////////////////////////////
// RemoteInputPlugin:

TEST_F(PluginsTest, RemoteInputAnnouncesKeyboardOnStart)
{
	auto sink = std::make_shared<RecordingInputSink>();
	RemoteInputPlugin plugin("dev", mRouter, deviceLogger(), sink);
	plugin.start();
	auto sent = mRouter.sent(RemoteInputPlugin::PACKET_TYPE_KEYBOARDSTATE);
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_TRUE(sent[0].bodyBool("state"));
}





TEST_F(PluginsTest, RemoteInputTranslatesRequests)
{
	auto sink = std::make_shared<RecordingInputSink>();
	RemoteInputPlugin plugin("dev", mRouter, deviceLogger(), sink);

	QJsonObject move;
	move.insert("dx", 3);
	move.insert("dy", -2);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, move));

	QJsonObject scroll(move);
	scroll.insert("scroll", true);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, scroll));

	QJsonObject clicks;
	clicks.insert("singleclick", true);
	clicks.insert("rightclick", true);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, clicks));

	QJsonObject key;
	key.insert("key", "a");
	key.insert("ctrl", true);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, key));

	QJsonObject special;
	special.insert("specialKey", 35);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, special));

	EXPECT_EQ(sink->mEvents, (std::vector<QString>{
		"move 3 -2",
		"scroll 3 -2",
		QString("click %1").arg(InputSink::mbLeft),
		QString("click %1").arg(InputSink::mbRight),
		"type Ctrl+a",
		"key F5",
	}));
	EXPECT_TRUE(mRouter.mSent.empty());
}





TEST_F(PluginsTest, RemoteInputEchoesWhenAskedForAck)
{
	auto sink = std::make_shared<RecordingInputSink>();
	RemoteInputPlugin plugin("dev", mRouter, deviceLogger(), sink);
	QJsonObject body;
	body.insert("key", "x");
	body.insert("sendAck", true);
	plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST, body));
	auto echoes = mRouter.sent(RemoteInputPlugin::PACKET_TYPE_ECHO);
	ASSERT_EQ(echoes.size(), 1u);
	EXPECT_TRUE(echoes[0].bodyBool("isAck"));
	EXPECT_FALSE(echoes[0].bodyContains("sendAck"));
	EXPECT_EQ(echoes[0].bodyString("key"), "x");
}





TEST_F(PluginsTest, RemoteInputWithoutSinkFails)
{
	RemoteInputPlugin plugin("dev", mRouter, deviceLogger(), nullptr);
	EXPECT_THROW(plugin.handlePacket(Packet(RemoteInputPlugin::PACKET_TYPE_REQUEST)), Plugin::PluginError);
	EXPECT_THROW(plugin.handlePacket(Packet("kdeconnect.ping")), Plugin::PluginError);
}





TEST(InputSinkTest, KeyNames)
{
	EXPECT_EQ(InputSink::specialKeyName(InputSink::skBackspace), "Backspace");
	EXPECT_EQ(InputSink::specialKeyName(InputSink::skF12), "F12");
	EXPECT_EQ(InputSink::specialKeyName(99), "<key 99>");
	InputSink::Modifiers mods;
	mods.mShift = true;
	mods.mCtrl = true;
	EXPECT_EQ(InputSink::modifiersToString(mods), "Ctrl+Shift+");
}





////////////////////////////////////////////////////////////////////////////////
// SystemVolumePlugin:

TEST_F(PluginsTest, SystemVolumeSendsSinkListOnStartAndRequest)
{
	auto backend = std::make_shared<MemoryAudioBackend>();
	SystemVolumePlugin plugin("dev", mRouter, deviceLogger(), backend);
	plugin.start();
	auto sent = mRouter.sent(SystemVolumePlugin::PACKET_TYPE_SINKS);
	ASSERT_EQ(sent.size(), 1u);
	auto list = sent[0].body().value("sinkList").toArray();
	ASSERT_EQ(list.size(), 2);
	EXPECT_EQ(list[0].toObject().value("name").toString(), "speakers");
	EXPECT_EQ(list[1].toObject().value("volume").toInt(), 80);

	// The reply uses the flavor of the request:
	QJsonObject body;
	body.insert("requestSinks", true);
	plugin.handlePacket(Packet(SystemVolumePlugin::PACKET_TYPE_REQUEST_COSMIC, body));
	EXPECT_EQ(mRouter.sent(SystemVolumePlugin::PACKET_TYPE_SINKS_COSMIC).size(), 1u);
}





TEST_F(PluginsTest, SystemVolumeAppliesChanges)
{
	auto backend = std::make_shared<MemoryAudioBackend>();
	SystemVolumePlugin plugin("dev", mRouter, deviceLogger(), backend);

	QJsonObject volume;
	volume.insert("volume", 20);
	plugin.handlePacket(Packet(SystemVolumePlugin::PACKET_TYPE_REQUEST, volume));
	EXPECT_EQ(backend->find("speakers")->mVolume, 20);

	QJsonObject hdmi;
	hdmi.insert("name", "hdmi");
	hdmi.insert("muted", false);
	hdmi.insert("enabled", true);
	plugin.handlePacket(Packet(SystemVolumePlugin::PACKET_TYPE_REQUEST, hdmi));
	EXPECT_FALSE(backend->find("hdmi")->mMuted);
	EXPECT_EQ(backend->defaultSinkName(), "hdmi");

	// Each change is answered with the new sink list:
	EXPECT_EQ(mRouter.sent(SystemVolumePlugin::PACKET_TYPE_SINKS).size(), 2u);
	EXPECT_THROW(plugin.handlePacket(Packet("kdeconnect.ping")), Plugin::PluginError);
}





////////////////////////////////////////////////////////////////////////////////
// MprisPlugin:

TEST_F(PluginsTest, MprisAnswersPlayerListAndNowPlaying)
{
	auto backend = std::make_shared<MemoryMediaPlayerBackend>();
	MprisPlugin plugin("dev", mRouter, deviceLogger(), backend);

	QJsonObject listReq;
	listReq.insert("requestPlayerList", true);
	plugin.handlePacket(Packet(MprisPlugin::PACKET_TYPE_REQUEST, listReq));
	auto sent = mRouter.sent(MprisPlugin::PACKET_TYPE_STATE);
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].body().value("playerList").toArray().size(), 1);
	EXPECT_FALSE(sent[0].bodyBool("supportAlbumArtPayload", true));

	QJsonObject play;
	play.insert("player", "vlc");
	play.insert("action", "Play");
	play.insert("requestNowPlaying", true);
	plugin.handlePacket(Packet(MprisPlugin::PACKET_TYPE_REQUEST, play));
	EXPECT_EQ(backend->mActions, (std::vector<QString>{"vlc:Play"}));
	sent = mRouter.sent(MprisPlugin::PACKET_TYPE_STATE);
	ASSERT_EQ(sent.size(), 2u);
	EXPECT_EQ(sent[1].bodyString("player"), "vlc");
	EXPECT_TRUE(sent[1].bodyBool("isPlaying"));
	EXPECT_EQ(sent[1].bodyString("title"), "Song");
	EXPECT_EQ(sent[1].bodyInt("length"), 180000);
}





TEST_F(PluginsTest, MprisRejectsInvalidRequests)
{
	auto backend = std::make_shared<MemoryMediaPlayerBackend>();
	MprisPlugin plugin("dev", mRouter, deviceLogger(), backend);

	QJsonObject unknownPlayer;
	unknownPlayer.insert("player", "nope");
	unknownPlayer.insert("action", "Play");
	EXPECT_THROW(plugin.handlePacket(Packet(MprisPlugin::PACKET_TYPE_REQUEST, unknownPlayer)), Plugin::PluginError);

	QJsonObject badAction;
	badAction.insert("player", "vlc");
	badAction.insert("action", "Explode");
	EXPECT_THROW(plugin.handlePacket(Packet(MprisPlugin::PACKET_TYPE_REQUEST, badAction)), Plugin::PluginError);

	QJsonObject badLoop;
	badLoop.insert("player", "vlc");
	badLoop.insert("setLoopStatus", "Forever");
	EXPECT_THROW(plugin.handlePacket(Packet(MprisPlugin::PACKET_TYPE_REQUEST, badLoop)), Plugin::PluginError);
	EXPECT_TRUE(backend->mActions.empty());
}





TEST_F(PluginsTest, MprisPushesBackendChangesWhileStarted)
{
	auto backend = std::make_shared<MemoryMediaPlayerBackend>();
	MprisPlugin plugin("dev", mRouter, deviceLogger(), backend);
	plugin.start();
	emit backend->playerStateChanged("vlc");
	emit backend->playerListChanged();
	EXPECT_EQ(mRouter.sent(MprisPlugin::PACKET_TYPE_STATE).size(), 2u);

	plugin.stop();
	emit backend->playerStateChanged("vlc");
	EXPECT_EQ(mRouter.sent(MprisPlugin::PACKET_TYPE_STATE).size(), 2u);
}





////////////////////////////////////////////////////////////////////////////////
// SharePlugin:

TEST_F(PluginsTest, ShareTextAndUrl)
{
	SharePlugin plugin("dev", mRouter, deviceLogger(), mTempDir.path() + "/downloads");
	std::vector<QString> texts, urls;
	QObject::connect(&plugin, &SharePlugin::textReceived,
		[&texts](const QString & aDeviceId, const QString & aText) { Q_UNUSED(aDeviceId); texts.push_back(aText); }
	);
	QObject::connect(&plugin, &SharePlugin::urlReceived,
		[&urls](const QString & aDeviceId, const QString & aUrl) { Q_UNUSED(aDeviceId); urls.push_back(aUrl); }
	);

	QJsonObject text;
	text.insert("text", "hello");
	plugin.handlePacket(Packet(SharePlugin::PACKET_TYPE, text));
	QJsonObject url;
	url.insert("url", "https://kde.org");
	plugin.handlePacket(Packet(SharePlugin::PACKET_TYPE, url));
	EXPECT_EQ(texts, (std::vector<QString>{"hello"}));
	EXPECT_EQ(urls, (std::vector<QString>{"https://kde.org"}));
	EXPECT_THROW(plugin.handlePacket(Packet(SharePlugin::PACKET_TYPE)), Plugin::PluginError);

	EXPECT_TRUE(plugin.shareText("out"));
	EXPECT_TRUE(plugin.shareUrl("https://example.com"));
	auto sent = mRouter.sent(SharePlugin::PACKET_TYPE);
	ASSERT_EQ(sent.size(), 2u);
	EXPECT_EQ(sent[0].bodyString("text"), "out");
	EXPECT_EQ(sent[1].bodyString("url"), "https://example.com");
}





TEST_F(PluginsTest, ShareUniqueFileNames)
{
	auto folder = mTempDir.path();
	EXPECT_EQ(SharePlugin::uniqueFileName(folder, "../../etc/passwd"), QDir(folder).filePath("passwd"));
	QFile existing(QDir(folder).filePath("photo.jpg"));
	ASSERT_TRUE(existing.open(QIODevice::WriteOnly));
	existing.close();
	EXPECT_EQ(SharePlugin::uniqueFileName(folder, "photo.jpg"), QDir(folder).filePath("photo (1).jpg"));
	EXPECT_EQ(SharePlugin::uniqueFileName(folder, ".."), QDir(folder).filePath("received"));
}





TEST_F(PluginsTest, ShareReceivesFile)
{
	auto downloads = mTempDir.path() + "/downloads";
	SharePlugin plugin("dev", mRouter, deviceLogger(), downloads);
	QString receivedName;
	QObject::connect(&plugin, &SharePlugin::fileReceived,
		[&receivedName](const QString & aDeviceId, const QString & aFileName) { Q_UNUSED(aDeviceId); receivedName = aFileName; }
	);

	QJsonObject body;
	body.insert("filename", "note.txt");
	QJsonObject info;
	info.insert("port", 1740);
	plugin.handlePacket(overTheWire(Packet(SharePlugin::PACKET_TYPE, body).withPayload(5, info)));
	ASSERT_EQ(mRouter.mDownloads.size(), 1u);
	auto download = std::dynamic_pointer_cast<PayloadDownload>(mRouter.mDownloads[0]);
	ASSERT_NE(download, nullptr);
	download->feed("hello");
	EXPECT_TRUE(download->hasSucceeded());
	EXPECT_EQ(receivedName, QDir(downloads).filePath("note.txt"));

	QFile f(receivedName);
	ASSERT_TRUE(f.open(QIODevice::ReadOnly));
	EXPECT_EQ(f.readAll(), QByteArray("hello"));
}





TEST_F(PluginsTest, ShareRemovesPartialFileOnFailure)
{
	auto downloads = mTempDir.path() + "/downloads";
	SharePlugin plugin("dev", mRouter, deviceLogger(), downloads);
	QJsonObject body;
	body.insert("filename", "big.bin");
	QJsonObject info;
	info.insert("port", 1740);
	plugin.handlePacket(overTheWire(Packet(SharePlugin::PACKET_TYPE, body).withPayload(100, info)));
	ASSERT_EQ(mRouter.mDownloads.size(), 1u);
	auto download = std::dynamic_pointer_cast<PayloadDownload>(mRouter.mDownloads[0]);
	ASSERT_NE(download, nullptr);
	download->feed("partial");
	download->streamFinished();
	EXPECT_TRUE(download->isDone());
	EXPECT_FALSE(download->hasSucceeded());
	EXPECT_FALSE(QFile::exists(QDir(downloads).filePath("big.bin")));
}





TEST_F(PluginsTest, ShareWithoutPayloadFails)
{
	SharePlugin plugin("dev", mRouter, deviceLogger(), mTempDir.path() + "/downloads");
	QJsonObject body;
	body.insert("filename", "x.txt");
	EXPECT_THROW(plugin.handlePacket(Packet(SharePlugin::PACKET_TYPE, body)), Plugin::PluginError);

	// The router refuses the payload (no port), no file is left behind:
	QJsonObject info;
	EXPECT_THROW(plugin.handlePacket(Packet(SharePlugin::PACKET_TYPE, body).withPayload(10, info)), Plugin::PluginError);
	EXPECT_FALSE(QFile::exists(QDir(mTempDir.path() + "/downloads").filePath("x.txt")));
}
