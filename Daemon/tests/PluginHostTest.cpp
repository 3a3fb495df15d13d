#include <vector>
#include <gtest/gtest.h>
#include "Plugins/PingPlugin.hpp"
#include "Plugins/PluginHost.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "TestHelpers.hpp"





/** A plugin that records its lifecycle and the packets, optionally failing on them. */
class ProbePlugin:
	public Plugin
{
	using Super = Plugin;


public:

	ProbePlugin(const QString & aName, const QString & aDeviceId, PacketRouter & aRouter, Logger & aLogger):
		Super(aName, aDeviceId, aRouter, aLogger),
		mShouldFailPackets(false),
		mShouldFailStart(false),
		mShouldThrowStd(false),
		mNumStarted(0),
		mNumStopped(0)
	{
	}

	bool mShouldFailPackets;
	bool mShouldFailStart;
	bool mShouldThrowStd;
	int mNumStarted;
	int mNumStopped;
	std::vector<QString> mReceived;

	virtual void start() override
	{
		if (mShouldFailStart)
		{
			throw PluginError("Refusing to start");
		}
		mNumStarted += 1;
	}

	virtual void stop() override
	{
		mNumStopped += 1;
	}

	virtual void handlePacket(const Packet & aPacket) override
	{
		mReceived.push_back(aPacket.type());
		if (mShouldThrowStd)
		{
			throw std::runtime_error("unexpected");
		}
		if (mShouldFailPackets)
		{
			throw PluginError("Cannot handle %1", aPacket.type());
		}
	}
};





class PluginHostTest:
	public ComponentsTest
{
protected:

	RecordingRouter mRouter;


	PluginHostTest():
		mRouter(logger("Router"))
	{
	}


	std::shared_ptr<ProbePlugin> probe(const QString & aName)
	{
		return std::make_shared<ProbePlugin>(aName, "dev", mRouter, logger("Device-dev"));
	}
};





TEST_F(PluginHostTest, DispatchesOnlyNegotiatedTypesToAllClaimants)
{
	PluginHost host("dev", {"x.a", "x.b"}, logger("Device-dev"));
	auto p1 = probe("p1");
	auto p2 = probe("p2");
	host.addPlugin(p1, {"x.a", "x.c"});
	host.addPlugin(p2, {"x.a", "x.b"});
	host.start();
	EXPECT_EQ(p1->mNumStarted, 1);
	EXPECT_EQ(p2->mNumStarted, 1);

	EXPECT_EQ(host.dispatch(Packet("x.a")), 2u);
	EXPECT_EQ(host.dispatch(Packet("x.b")), 1u);

	// x.c was not negotiated, x.zzz is unknown:
	EXPECT_EQ(host.dispatch(Packet("x.c")), 0u);
	EXPECT_EQ(host.dispatch(Packet("x.zzz")), 0u);

	EXPECT_EQ(p1->mReceived, (std::vector<QString>{"x.a"}));
	EXPECT_EQ(p2->mReceived, (std::vector<QString>{"x.a", "x.b"}));
}





TEST_F(PluginHostTest, FailingPluginDoesNotAffectOthers)
{
	PluginHost host("dev", {"x.a"}, logger("Device-dev"));
	auto failing = probe("failing");
	auto throwingStd = probe("throwingStd");
	auto healthy = probe("healthy");
	failing->mShouldFailPackets = true;
	throwingStd->mShouldThrowStd = true;
	host.addPlugin(failing, {"x.a"});
	host.addPlugin(throwingStd, {"x.a"});
	host.addPlugin(healthy, {"x.a"});
	host.start();

	EXPECT_EQ(host.dispatch(Packet("x.a")), 3u);
	EXPECT_EQ(host.dispatch(Packet("x.a")), 3u);
	EXPECT_EQ(healthy->mReceived.size(), 2u);
	EXPECT_EQ(failing->mReceived.size(), 2u);
}





TEST_F(PluginHostTest, PluginFailingToStartIsRemoved)
{
	PluginHost host("dev", {"x.a"}, logger("Device-dev"));
	auto bad = probe("bad");
	auto good = probe("good");
	bad->mShouldFailStart = true;
	host.addPlugin(bad, {"x.a"});
	host.addPlugin(good, {"x.a"});
	host.start();
	EXPECT_EQ(host.plugins().size(), 1u);
	EXPECT_EQ(host.plugin("bad"), nullptr);
	EXPECT_EQ(host.plugin("good"), good);
	EXPECT_EQ(host.dispatch(Packet("x.a")), 1u);
	EXPECT_TRUE(bad->mReceived.empty());
}





TEST_F(PluginHostTest, StopEndsDispatchAndCannotAddAfterStart)
{
	PluginHost host("dev", {"x.a"}, logger("Device-dev"));
	auto p = probe("p");
	host.addPlugin(p, {"x.a"});
	host.start();
	EXPECT_THROW(host.addPlugin(probe("late"), {"x.a"}), LogicError);
	host.stop();
	host.stop();
	EXPECT_EQ(p->mNumStopped, 1);
	EXPECT_EQ(host.dispatch(Packet("x.a")), 0u);
}





TEST_F(PluginHostTest, NegotiationIntersectsCapabilities)
{
	auto negotiated = PluginRegistry::negotiate(
		{"kdeconnect.ping", "kdeconnect.mpris.request"},
		{"kdeconnect.ping", "kdeconnect.mpris"},
		{"kdeconnect.ping"},
		{"kdeconnect.mpris.request"}
	);
	EXPECT_EQ(negotiated, (QStringList{"kdeconnect.mpris.request", "kdeconnect.ping"}));

	// A peer that announces nothing gets all our capabilities:
	auto legacy = PluginRegistry::negotiate({"b", "a"}, {"c"}, {}, {});
	EXPECT_EQ(legacy, (QStringList{"a", "b", "c"}));
}





TEST_F(PluginHostTest, RegistryCreatesOnlyApplicablePlugins)
{
	auto registry = mComponents.addNew<PluginRegistry>();
	registry->registerFactory(PingPlugin::factory());
	registry->registerFactory(std::make_shared<PluginFactory>(
		"other", QStringList{"x.other"}, QStringList{},
		[](const QString & aDeviceId, PacketRouter & aRouter, Logger & aLogger)
		{
			return std::make_shared<ProbePlugin>("other", aDeviceId, aRouter, aLogger);
		}
	));
	EXPECT_THROW(registry->registerFactory(PingPlugin::factory()), LogicError);
	EXPECT_EQ(registry->allIncomingCapabilities(), (QStringList{"kdeconnect.ping", "x.other"}));
	EXPECT_EQ(registry->allOutgoingCapabilities(), (QStringList{"kdeconnect.ping"}));

	auto peer = makeIdentity("dev", {"kdeconnect.ping"}, {"kdeconnect.ping"});
	auto host = registry->createHost(peer, mRouter);
	ASSERT_EQ(host->plugins().size(), 1u);
	EXPECT_NE(host->plugin<PingPlugin>(), nullptr);
	EXPECT_EQ(host->plugin("other"), nullptr);
	EXPECT_EQ(host->negotiatedCapabilities(), QStringList{"kdeconnect.ping"});
}





TEST_F(PluginHostTest, PingPluginCountsAndSends)
{
	PluginHost host("dev", {PingPlugin::PACKET_TYPE}, logger("Device-dev"));
	auto ping = std::make_shared<PingPlugin>("dev", mRouter, logger("Device-dev"));
	int numSignals = 0;
	QObject::connect(ping.get(), &PingPlugin::pingReceived,
		[&numSignals](const QString & aDeviceId, const QString & aMessage)
		{
			EXPECT_EQ(aDeviceId, "dev");
			Q_UNUSED(aMessage);
			numSignals += 1;
		}
	);
	host.addPlugin(ping, {PingPlugin::PACKET_TYPE});
	host.start();

	QJsonObject body;
	body.insert("message", "hi");
	host.dispatch(overTheWire(Packet(PingPlugin::PACKET_TYPE, body)));
	host.dispatch(overTheWire(Packet(PingPlugin::PACKET_TYPE)));
	EXPECT_EQ(ping->numReceived(), 2);
	EXPECT_EQ(numSignals, 2);
	EXPECT_TRUE(ping->lastMessage().isEmpty());

	EXPECT_TRUE(ping->sendPing("hello"));
	ASSERT_EQ(mRouter.mSent.size(), 1u);
	EXPECT_EQ(mRouter.mSent[0].first, "dev");
	EXPECT_EQ(mRouter.mSent[0].second.bodyString("message"), "hello");

	mRouter.mIsConnected = false;
	EXPECT_FALSE(ping->sendPing());
}
