#include <set>
#include <vector>
#include <gtest/gtest.h>
#include "Discovery.hpp"
#include "Protocol.hpp"
#include "TestHelpers.hpp"





/** Collects the signals of a Discovery instance. */
class DiscoveryTest:
	public ComponentsTest
{
protected:

	std::shared_ptr<Discovery> mDiscovery;
	std::vector<DeviceIdentity> mDiscovered;
	std::vector<DeviceIdentity> mUpdated;
	std::vector<QString> mLost;


	DiscoveryTest()
	{
		mDiscovery = mComponents.addNew<Discovery>(QString("local_device"), 30000);
		QObject::connect(mDiscovery.get(), &Discovery::deviceDiscovered,
			[this](const DeviceIdentity & aIdentity) { mDiscovered.push_back(aIdentity); }
		);
		QObject::connect(mDiscovery.get(), &Discovery::deviceUpdated,
			[this](const DeviceIdentity & aIdentity) { mUpdated.push_back(aIdentity); }
		);
		QObject::connect(mDiscovery.get(), &Discovery::deviceLost,
			[this](const QString & aDeviceId) { mLost.push_back(aDeviceId); }
		);
	}


	static QByteArray datagram(const QString & aDeviceId, const QString & aName = "Phone")
	{
		DeviceIdentity identity(aDeviceId, aName, DeviceIdentity::dtPhone, {"kdeconnect.ping"}, {"kdeconnect.ping"}, 1716);
		return identity.toIdentityPacket().serialize();
	}
};





TEST_F(DiscoveryTest, ReportsNewDeviceOnceThenUpdates)
{
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 1000);
	ASSERT_EQ(mDiscovered.size(), 1u);
	EXPECT_EQ(mDiscovered[0].deviceId(), "phone");
	EXPECT_EQ(mDiscovered[0].address(), QHostAddress("192.168.1.10"));
	EXPECT_TRUE(mUpdated.empty());

	mDiscovery->processDatagram(datagram("phone", "Renamed"), QHostAddress("192.168.1.11"), 2000);
	EXPECT_EQ(mDiscovered.size(), 1u);
	ASSERT_EQ(mUpdated.size(), 1u);
	EXPECT_EQ(mUpdated[0].name(), "Renamed");
	EXPECT_EQ(mUpdated[0].address(), QHostAddress("192.168.1.11"));
	EXPECT_EQ(mDiscovery->devices().size(), 1u);
}





TEST_F(DiscoveryTest, IgnoresOwnAndInvalidDatagrams)
{
	mDiscovery->processDatagram(datagram("local_device"), QHostAddress::LocalHost, 1000);
	mDiscovery->processDatagram("garbage", QHostAddress::LocalHost, 1000);
	mDiscovery->processDatagram(Packet("kdeconnect.ping").serialize(), QHostAddress::LocalHost, 1000);
	EXPECT_TRUE(mDiscovered.empty());
	EXPECT_TRUE(mUpdated.empty());
	EXPECT_TRUE(mDiscovery->devices().empty());
}





TEST_F(DiscoveryTest, LostAfterLivenessTimeoutAndRediscovered)
{
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 1000);
	mDiscovery->checkLiveness(1000 + 30000);
	EXPECT_TRUE(mLost.empty());

	mDiscovery->checkLiveness(1000 + 30001);
	ASSERT_EQ(mLost.size(), 1u);
	EXPECT_EQ(mLost[0], "phone");

	// Lost is reported only once:
	mDiscovery->checkLiveness(1000 + 60000);
	EXPECT_EQ(mLost.size(), 1u);

	// The device is kept, and reported as discovered again when it re-announces:
	ASSERT_EQ(mDiscovery->devices().size(), 1u);
	EXPECT_FALSE(mDiscovery->devices()[0].isReachable());
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 70000);
	EXPECT_EQ(mDiscovered.size(), 2u);
	EXPECT_TRUE(mDiscovery->devices()[0].isReachable());
}





TEST_F(DiscoveryTest, OnlyMostRecentLostDevicesAreKept)
{
	// A flood of announcements under made-up device IDs, followed by one real device:
	const QHostAddress sender("192.168.1.66");
	auto numFlooded = Discovery::MAX_LOST_DEVICES + 10;
	for (size_t i = 0; i < numFlooded; ++i)
	{
		mDiscovery->processDatagram(datagram(QString("fake_%1").arg(i)), sender, 1000 + static_cast<qint64>(i));
	}
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 100000);
	mDiscovery->checkLiveness(100001);
	EXPECT_EQ(mLost.size(), numFlooded);

	std::set<QString> kept;
	for (const auto & dev: mDiscovery->devices())
	{
		kept.insert(dev.deviceId());
	}
	EXPECT_EQ(kept.size(), Discovery::MAX_LOST_DEVICES + 1);
	EXPECT_EQ(kept.count("phone"), 1u);
	EXPECT_EQ(kept.count("fake_0"), 0u);
	EXPECT_EQ(kept.count("fake_9"), 0u);
	EXPECT_EQ(kept.count("fake_10"), 1u);
	EXPECT_EQ(kept.count(QString("fake_%1").arg(numFlooded - 1)), 1u);
}





TEST_F(DiscoveryTest, NewDevicePushesOutLeastRecentWhenFull)
{
	const QHostAddress sender("192.168.1.66");
	for (size_t i = 0; i < Discovery::MAX_DEVICES; ++i)
	{
		mDiscovery->processDatagram(datagram(QString("fake_%1").arg(i)), sender, 1000 + static_cast<qint64>(i));
	}
	EXPECT_EQ(mDiscovery->devices().size(), Discovery::MAX_DEVICES);
	EXPECT_TRUE(mLost.empty());

	// fake_0 re-announces, so fake_1 becomes the least recently seen:
	mDiscovery->processDatagram(datagram("fake_0"), sender, 5000);
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 5001);
	EXPECT_EQ(mDiscovery->devices().size(), Discovery::MAX_DEVICES);
	ASSERT_EQ(mLost.size(), 1u);
	EXPECT_EQ(mLost[0], "fake_1");
	ASSERT_FALSE(mDiscovered.empty());
	EXPECT_EQ(mDiscovered.back().deviceId(), "phone");
}





TEST_F(DiscoveryTest, LostDeviceIsPushedOutBeforeReachableOne)
{
	const QHostAddress sender("192.168.1.66");
	mDiscovery->processDatagram(datagram("old_phone"), sender, 1000);
	mDiscovery->checkLiveness(40000);
	ASSERT_EQ(mLost.size(), 1u);
	for (size_t i = 1; i < Discovery::MAX_DEVICES; ++i)
	{
		mDiscovery->processDatagram(datagram(QString("fake_%1").arg(i)), sender, 40000 + static_cast<qint64>(i));
	}

	// The lost device is forgotten silently, no reachable device is pushed out:
	mDiscovery->processDatagram(datagram("phone"), QHostAddress("192.168.1.10"), 50000);
	EXPECT_EQ(mLost.size(), 1u);
	auto devices = mDiscovery->devices();
	EXPECT_EQ(devices.size(), Discovery::MAX_DEVICES);
	for (const auto & dev: devices)
	{
		EXPECT_NE(dev.deviceId(), "old_phone");
	}
}
