#include <QDateTime>
#include <gtest/gtest.h>
#include "DeviceMgr.hpp"
#include "PairingService.hpp"
#include "Protocol.hpp"
#include "Plugins/PingPlugin.hpp"
#include "Plugins/PluginHost.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "TestHelpers.hpp"





/** The ID of the local device; smaller than PHONE, so our outbound connections win the tie-breaks. */
static const QString LOCAL = "aaa";
static const QString PHONE = "phone";
static const QString PHONE_FP = "AA:BB";





class DeviceMgrTest:
	public ComponentsTest
{
protected:

	std::shared_ptr<MemoryTrustStore> mTrustStore;
	std::shared_ptr<PairingService> mPairing;
	std::shared_ptr<DeviceMgr> mDevMgr;
	std::vector<std::pair<QString, Device::State>> mStateChanges;
	int mNumConnections;


	DeviceMgrTest():
		mNumConnections(0)
	{
		mTrustStore = mComponents.addNew<MemoryTrustStore>();
		mPairing = mComponents.addNew<PairingService>(LOCAL);
		auto registry = mComponents.addNew<PluginRegistry>();
		registry->registerFactory(PingPlugin::factory());
		mDevMgr = mComponents.addNew<DeviceMgr>(LOCAL, 60000);
		mComponents.start();
		QObject::connect(mDevMgr.get(), &DeviceMgr::connectionStateChanged,
			[this](const QString & aDeviceId, Device::State aNewState)
			{
				mStateChanges.emplace_back(aDeviceId, aNewState);
			}
		);
	}


	virtual void TearDown() override
	{
		mDevMgr->stop();
		pumpEvents();
	}


	/** Returns a new connection to PHONE, established with the specified certificate. */
	FakeConnectionPtr connectPhone(
		Connection::Direction aDirection = Connection::cdInbound,
		const QString & aFingerprint = PHONE_FP
	)
	{
		mNumConnections += 1;
		auto conn = std::make_shared<FakeConnection>(
			mComponents, QByteArray("conn") + QByteArray::number(mNumConnections), aDirection
		);
		conn->establish(makeIdentity(PHONE, {PingPlugin::PACKET_TYPE}, {PingPlugin::PACKET_TYPE}), aFingerprint);
		mDevMgr->addConnection(conn);
		return conn;
	}


	static Packet pairRequest()
	{
		QJsonObject body;
		body.insert("pair", true);
		body.insert("timestamp", 1700000000);
		return Packet(Protocol::PACKET_TYPE_PAIR, body);
	}


	static Packet pairAnswer(bool aPair)
	{
		QJsonObject body;
		body.insert("pair", aPair);
		return Packet(Protocol::PACKET_TYPE_PAIR, body);
	}


	std::shared_ptr<PingPlugin> phonePing()
	{
		auto host = mDevMgr->pluginHost(PHONE);
		if (host == nullptr)
		{
			return nullptr;
		}
		return host->plugin<PingPlugin>();
	}
};





TEST_F(DeviceMgrTest, TrustedConnectionIsPairedAndReachesPlugins)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	auto conn = connectPhone();
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	ASSERT_NE(phonePing(), nullptr);

	conn->deliver(Packet(PingPlugin::PACKET_TYPE));
	EXPECT_EQ(phonePing()->numReceived(), 1);

	// The plugins send through the device's connection:
	EXPECT_TRUE(phonePing()->sendPing("hi"));
	auto sent = conn->sentPackets(PingPlugin::PACKET_TYPE);
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].bodyString("message"), "hi");

	auto snapshot = mDevMgr->device(PHONE);
	ASSERT_TRUE(snapshot.isPresent());
	EXPECT_EQ(snapshot.value().mCertificateFingerprint, PHONE_FP);
	EXPECT_TRUE(snapshot.value().mNegotiatedCapabilities.contains(PingPlugin::PACKET_TYPE));
}





TEST_F(DeviceMgrTest, MismatchedCertificateIsRefused)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	QString reportedFp;
	QObject::connect(mDevMgr.get(), &DeviceMgr::untrustedCertificate,
		[&reportedFp](const QString & aDeviceId, const QString & aFingerprint)
		{
			Q_UNUSED(aDeviceId);
			reportedFp = aFingerprint;
		}
	);
	auto conn = connectPhone(Connection::cdInbound, "CC:DD");
	EXPECT_EQ(conn->state(), Connection::csDisconnected);
	EXPECT_EQ(reportedFp, "CC:DD");
	EXPECT_NE(mDevMgr->deviceState(PHONE), Device::dsPaired);
	EXPECT_EQ(mDevMgr->pluginHost(PHONE), nullptr);

	// The trust is kept, but the device is no longer reconnected automatically:
	EXPECT_TRUE(mTrustStore->isTrusted(PHONE));
	auto snapshot = mDevMgr->device(PHONE);
	ASSERT_TRUE(snapshot.isPresent());
	EXPECT_FALSE(snapshot.value().mIsAutoReconnectEnabled);
}





TEST_F(DeviceMgrTest, UnpairedDevicePacketsAreDropped)
{
	auto conn = connectPhone();
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnected);
	EXPECT_EQ(mDevMgr->pluginHost(PHONE), nullptr);
	conn->deliver(Packet(PingPlugin::PACKET_TYPE));
	EXPECT_EQ(conn->state(), Connection::csEstablished);
	EXPECT_FALSE(mDevMgr->sendPacket("unknown", Packet(PingPlugin::PACKET_TYPE)));
}





TEST_F(DeviceMgrTest, IncomingPairingAcceptedLocally)
{
	QString requestedBy;
	QObject::connect(mDevMgr.get(), &DeviceMgr::pairingRequested,
		[&requestedBy](const QString & aDeviceId)
		{
			requestedBy = aDeviceId;
		}
	);
	auto conn = connectPhone();
	conn->deliver(pairRequest());
	EXPECT_EQ(requestedBy, PHONE);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPairing);

	EXPECT_TRUE(mDevMgr->acceptPairing(PHONE));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	EXPECT_EQ(mTrustStore->verify(PHONE, PHONE_FP), TrustStore::tvTrusted);
	auto answers = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(answers.size(), 1u);
	EXPECT_TRUE(answers[0].bodyBool("pair"));
	EXPECT_FALSE(answers[0].bodyContains("timestamp"));

	// The device's packets now reach its plugins:
	ASSERT_NE(phonePing(), nullptr);
	conn->deliver(Packet(PingPlugin::PACKET_TYPE));
	EXPECT_EQ(phonePing()->numReceived(), 1);

	// The friendly name is stored along with the trust:
	auto entry = mTrustStore->lookup(PHONE);
	ASSERT_TRUE(entry.isPresent());
	EXPECT_EQ(entry.value().mFriendlyName, "Device " + PHONE);
}





TEST_F(DeviceMgrTest, IncomingPairingRejectedLocally)
{
	auto conn = connectPhone();
	conn->deliver(pairRequest());
	mDevMgr->rejectPairing(PHONE);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnected);
	EXPECT_FALSE(mTrustStore->isTrusted(PHONE));
	auto answers = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(answers.size(), 1u);
	EXPECT_FALSE(answers[0].bodyBool("pair", true));
}





TEST_F(DeviceMgrTest, LocalPairingRequestAnswersPeerRequest)
{
	std::vector<PairingService::PairingResult> results;
	QObject::connect(mDevMgr.get(), &DeviceMgr::pairingResult,
		[&results](const QString & aDeviceId, PairingService::PairingResult aResult)
		{
			Q_UNUSED(aDeviceId);
			results.push_back(aResult);
		}
	);
	auto conn = connectPhone();
	conn->deliver(pairRequest());
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPairing);

	// The local user asks to pair too, instead of accepting; the pending request is accepted:
	EXPECT_TRUE(mDevMgr->requestPairing(PHONE));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	EXPECT_EQ(mTrustStore->verify(PHONE, PHONE_FP), TrustStore::tvTrusted);
	EXPECT_EQ(results, (std::vector<PairingService::PairingResult>{PairingService::prAccepted}));
	auto answers = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(answers.size(), 1u);
	EXPECT_TRUE(answers[0].bodyBool("pair"));
	EXPECT_FALSE(answers[0].bodyContains("timestamp"));
}





TEST_F(DeviceMgrTest, OutgoingPairingAcceptedByPeer)
{
	auto conn = connectPhone();
	EXPECT_TRUE(mDevMgr->requestPairing(PHONE));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPairing);
	auto requests = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(requests.size(), 1u);
	EXPECT_TRUE(requests[0].bodyBool("pair"));
	EXPECT_TRUE(requests[0].bodyContains("timestamp"));

	std::vector<PairingService::PairingResult> results;
	QObject::connect(mDevMgr.get(), &DeviceMgr::pairingResult,
		[&results](const QString & aDeviceId, PairingService::PairingResult aResult)
		{
			Q_UNUSED(aDeviceId);
			results.push_back(aResult);
		}
	);
	conn->deliver(pairAnswer(true));
	EXPECT_EQ(results, (std::vector<PairingService::PairingResult>{PairingService::prAccepted}));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	EXPECT_NE(phonePing(), nullptr);

	// Requesting again is refused, the device is already paired:
	EXPECT_FALSE(mDevMgr->requestPairing(PHONE));
}





TEST_F(DeviceMgrTest, OutgoingPairingRejectedByPeer)
{
	auto conn = connectPhone();
	mDevMgr->requestPairing(PHONE);
	conn->deliver(pairAnswer(false));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnected);
	EXPECT_FALSE(mTrustStore->isTrusted(PHONE));
}





TEST_F(DeviceMgrTest, PeerUnpairReturnsToConnected)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	auto conn = connectPhone();
	ASSERT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	conn->deliver(pairAnswer(false));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnected);
	EXPECT_FALSE(mTrustStore->isTrusted(PHONE));
	EXPECT_EQ(mDevMgr->pluginHost(PHONE), nullptr);
	EXPECT_EQ(conn->state(), Connection::csEstablished);
}





TEST_F(DeviceMgrTest, LocalUnpairNotifiesPeer)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	auto conn = connectPhone();
	mDevMgr->unpair(PHONE);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnected);
	EXPECT_FALSE(mTrustStore->isTrusted(PHONE));
	auto sent = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_FALSE(sent[0].bodyBool("pair", true));
}





TEST_F(DeviceMgrTest, TrustedDeviceReconnectsWithBackoff)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	std::vector<QString> requested;
	QObject::connect(mDevMgr.get(), &DeviceMgr::connectionRequested,
		[&requested](const DeviceIdentity & aIdentity)
		{
			requested.push_back(aIdentity.deviceId());
		}
	);
	auto conn = connectPhone();
	conn->terminate();
	pumpEvents();
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsDisconnected);
	EXPECT_EQ(mDevMgr->pluginHost(PHONE), nullptr);

	// Not yet:
	auto now = QDateTime::currentMSecsSinceEpoch();
	mDevMgr->checkReconnects(now);
	EXPECT_TRUE(requested.empty());

	// After the first backoff:
	mDevMgr->checkReconnects(now + Device::RECONNECT_BASE_MSEC + 1000);
	EXPECT_EQ(requested, (std::vector<QString>{PHONE}));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnecting);

	// The attempt fails, the next one is scheduled later:
	mDevMgr->connMgrConnectionFailed(PHONE);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsDisconnected);
	mDevMgr->checkReconnects(QDateTime::currentMSecsSinceEpoch() + Device::RECONNECT_BASE_MSEC + 100);
	EXPECT_EQ(requested.size(), 1u);
	mDevMgr->checkReconnects(QDateTime::currentMSecsSinceEpoch() + 2 * Device::RECONNECT_BASE_MSEC + 1000);
	EXPECT_EQ(requested.size(), 2u);
}





TEST_F(DeviceMgrTest, ExplicitDisconnectStopsReconnecting)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	int numRequested = 0;
	QObject::connect(mDevMgr.get(), &DeviceMgr::connectionRequested,
		[&numRequested](const DeviceIdentity & aIdentity)
		{
			Q_UNUSED(aIdentity);
			numRequested += 1;
		}
	);
	auto conn = connectPhone();
	mDevMgr->disconnectDevice(PHONE);
	pumpEvents();
	EXPECT_EQ(conn->state(), Connection::csDisconnected);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsDisconnected);
	mDevMgr->checkReconnects(QDateTime::currentMSecsSinceEpoch() + 3600 * 1000);
	EXPECT_EQ(numRequested, 0);

	// Connecting explicitly re-enables it:
	mDevMgr->connectToDevice(PHONE);
	EXPECT_EQ(numRequested, 1);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnecting);
}





TEST_F(DeviceMgrTest, DuplicateConnectionKeepsSmallerIdInitiator)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	auto inbound = connectPhone(Connection::cdInbound);
	ASSERT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);

	// Our own connection wins, the phone's one is closed:
	auto outbound = connectPhone(Connection::cdOutbound);
	EXPECT_EQ(inbound->state(), Connection::csDisconnected);
	EXPECT_EQ(outbound->state(), Connection::csEstablished);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
	ASSERT_NE(phonePing(), nullptr);
	phonePing()->sendPing();
	EXPECT_EQ(outbound->sentPackets(PingPlugin::PACKET_TYPE).size(), 1u);
	EXPECT_TRUE(inbound->sentPackets(PingPlugin::PACKET_TYPE).empty());

	// A further connection from the phone loses against ours:
	auto inbound2 = connectPhone(Connection::cdInbound);
	EXPECT_EQ(inbound2->state(), Connection::csDisconnected);
	EXPECT_EQ(outbound->state(), Connection::csEstablished);
	pumpEvents();
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPaired);
}





TEST_F(DeviceMgrTest, RepeatedMalformedPacketsDropTheConnection)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	auto conn = connectPhone();
	conn->deliverRaw("{broken\n");
	conn->deliverRaw("not json either\n");
	EXPECT_EQ(conn->state(), Connection::csEstablished);

	// A valid packet resets the count:
	conn->deliver(Packet(PingPlugin::PACKET_TYPE));
	conn->deliverRaw("{\n[]\n");
	EXPECT_EQ(conn->state(), Connection::csEstablished);
	conn->deliverRaw("42\n");
	EXPECT_EQ(conn->state(), Connection::csDisconnected);
	pumpEvents();
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsDisconnected);
	EXPECT_EQ(phonePing(), nullptr);
}





TEST_F(DeviceMgrTest, DiscoveredTrustedDeviceIsConnected)
{
	mTrustStore->trust(PHONE, PHONE_FP);
	std::vector<QString> requested;
	QObject::connect(mDevMgr.get(), &DeviceMgr::connectionRequested,
		[&requested](const DeviceIdentity & aIdentity)
		{
			requested.push_back(aIdentity.deviceId());
		}
	);
	mDevMgr->discoveryDeviceFound(makeIdentity(PHONE));
	EXPECT_EQ(requested, (std::vector<QString>{PHONE}));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnecting);

	// An unknown device is only listed:
	mDevMgr->discoveryDeviceFound(makeIdentity("tablet"));
	EXPECT_EQ(requested.size(), 1u);
	EXPECT_EQ(mDevMgr->deviceState("tablet"), Device::dsDisconnected);
	EXPECT_EQ(mDevMgr->devices().size(), 2u);
}





TEST_F(DeviceMgrTest, PairingRequestedWhileDisconnectedIsSentOnConnect)
{
	mDevMgr->discoveryDeviceFound(makeIdentity(PHONE));
	EXPECT_TRUE(mDevMgr->requestPairing(PHONE));
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsConnecting);

	auto conn = connectPhone(Connection::cdOutbound);
	EXPECT_EQ(mDevMgr->deviceState(PHONE), Device::dsPairing);
	auto requests = conn->sentPackets(Protocol::PACKET_TYPE_PAIR);
	ASSERT_EQ(requests.size(), 1u);
	EXPECT_TRUE(requests[0].bodyContains("timestamp"));
}





TEST_F(DeviceMgrTest, OnlyMostRecentUntrustedLostDevicesAreKept)
{
	auto announce = [this](const QString & aDeviceId, qint64 aLastSeen)
	{
		auto identity = makeIdentity(aDeviceId);
		identity.setLastSeen(aLastSeen);
		mDevMgr->discoveryDeviceFound(identity);
	};

	// A paired device, lost long ago, is never forgotten:
	announce("paired_tablet", 1);
	mDevMgr->discoveryDeviceLost("paired_tablet");
	mTrustStore->trust("paired_tablet", "TT:TT");

	// A flood of made-up device IDs, each announced once:
	auto numFlooded = DeviceMgr::MAX_UNTRUSTED_LOST_DEVICES + 5;
	for (size_t i = 0; i < numFlooded; ++i)
	{
		auto id = QString("fake_%1").arg(i);
		announce(id, 1000 + static_cast<qint64>(i));
		mDevMgr->discoveryDeviceLost(id);
	}
	announce("visible_phone", 100000);

	EXPECT_EQ(mDevMgr->devices().size(), DeviceMgr::MAX_UNTRUSTED_LOST_DEVICES + 2);
	EXPECT_TRUE(mDevMgr->device("paired_tablet").isPresent());
	EXPECT_TRUE(mDevMgr->device("visible_phone").isPresent());
	EXPECT_FALSE(mDevMgr->device("fake_0").isPresent());
	EXPECT_FALSE(mDevMgr->device("fake_4").isPresent());
	EXPECT_TRUE(mDevMgr->device("fake_5").isPresent());
	EXPECT_TRUE(mStateChanges.empty());
}
