#include "Discovery.hpp"
#include <algorithm>
#include <QDateTime>
#include <QNetworkInterface>
#include "InstallConfiguration.hpp"
#include "LocalIdentity.hpp"
#include "Protocol.hpp"





/** How often the liveness of the discovered devices is checked. */
static const int LIVENESS_CHECK_INTERVAL_MSEC = 1000;





const size_t Discovery::MAX_LOST_DEVICES;
const size_t Discovery::MAX_DEVICES;





Discovery::Discovery(ComponentCollection & aComponents, const QString & aLocalDeviceId, int aLivenessTimeoutMsec):
	ComponentSuper(aComponents),
	mLocalDeviceId(aLocalDeviceId),
	mLivenessTimeoutMsec(aLivenessTimeoutMsec),
	mLogger(aComponents.logger("Discovery"))
{
	requireForStart(ComponentCollection::ckTcpListener);
	requireForStart(ComponentCollection::ckLocalIdentity);
	connect(&mBroadcastTimer, &QTimer::timeout,    this, &Discovery::broadcastIdentity);
	connect(&mLivenessTimer,  &QTimer::timeout,    this, [this]() { checkLiveness(QDateTime::currentMSecsSinceEpoch()); });
	connect(&mSocket,         &QUdpSocket::readyRead, this, &Discovery::socketReadyRead);
}





void Discovery::start()
{
	if (!mSocket.bind(QHostAddress::AnyIPv4, Protocol::UDP_PORT, QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint))
	{
		// Other devices can still find us through our broadcasts and connect to us
		mLogger.log("ERROR: Cannot bind the UDP port %1, discovery of other devices is disabled: %2",
			Protocol::UDP_PORT, mSocket.errorString()
		);
	}
	auto interval = 5000;
	if (mComponents.has(ComponentCollection::ckInstallConfiguration))
	{
		interval = mComponents.get<InstallConfiguration>()->discoveryIntervalMsec();
	}
	mBroadcastTimer.start(interval);
	mLivenessTimer.start(LIVENESS_CHECK_INTERVAL_MSEC);
	broadcastIdentity();
	mLogger.log("Discovery started, broadcasting every %1 msec", interval);
}





void Discovery::stop()
{
	mBroadcastTimer.stop();
	mLivenessTimer.stop();
	mSocket.close();
}





void Discovery::processDatagram(const QByteArray & aData, const QHostAddress & aSender, qint64 aNow)
{
	DeviceIdentity identity;
	try
	{
		auto packet = Packet::parse(aData.trimmed());
		if (packet.type() != Protocol::PACKET_TYPE_IDENTITY)
		{
			mLogger.log("Ignoring a non-identity datagram (%1) from %2", packet.type(), aSender);
			return;
		}
		identity = DeviceIdentity::fromIdentityPacket(packet, aSender, aNow);
	}
	catch (const Packet::MalformedPacketError & exc)
	{
		mLogger.log("Ignoring a malformed datagram from %1: %2", aSender, exc.what());
		return;
	}
	if (identity.deviceId() == mLocalDeviceId)
	{
		return;
	}

	bool isNew = false;
	DeviceIdentity current;
	QString pushedOut;
	{
		QMutexLocker lock(&mMtxDevices);
		auto itr = mDevices.find(identity.deviceId());
		if (itr == mDevices.end())
		{
			if ((mDevices.size() >= MAX_DEVICES) && forgetLeastRecentLocked(true).isEmpty())
			{
				pushedOut = forgetLeastRecentLocked(false);
			}
			isNew = true;
			itr = mDevices.insert(std::make_pair(identity.deviceId(), identity)).first;
		}
		else
		{
			isNew = !itr->second.isReachable();
			itr->second.refresh(identity);
		}
		current = itr->second;
	}

	if (!pushedOut.isEmpty())
	{
		mLogger.log("Too many devices announcing themselves, forgetting device %1", pushedOut);
		emit deviceLost(pushedOut);
	}
	if (isNew)
	{
		mLogger.log("Discovered device %1 (%2) at %3:%4", current.deviceId(), current.name(), aSender, current.tcpPort());
		emit deviceDiscovered(current);
	}
	else
	{
		emit deviceUpdated(current);
	}
}





void Discovery::checkLiveness(qint64 aNow)
{
	std::vector<QString> lost;
	{
		QMutexLocker lock(&mMtxDevices);
		for (auto & dev: mDevices)
		{
			if (dev.second.isReachable() && (aNow - dev.second.lastSeen() > mLivenessTimeoutMsec))
			{
				dev.second.setReachable(false);
				lost.push_back(dev.first);
			}
		}
		auto numLost = static_cast<size_t>(std::count_if(mDevices.begin(), mDevices.end(),
			[](const std::pair<const QString, DeviceIdentity> & aDev)
			{
				return !aDev.second.isReachable();
			}
		));
		for (; numLost > MAX_LOST_DEVICES; --numLost)
		{
			forgetLeastRecentLocked(true);
		}
	}
	for (const auto & id: lost)
	{
		mLogger.log("Device %1 hasn't announced itself for too long, considered lost", id);
		emit deviceLost(id);
	}
}





QString Discovery::forgetLeastRecentLocked(bool aLostOnly)
{
	auto oldest = mDevices.end();
	for (auto itr = mDevices.begin(); itr != mDevices.end(); ++itr)
	{
		if (aLostOnly && itr->second.isReachable())
		{
			continue;
		}
		if ((oldest == mDevices.end()) || (itr->second.lastSeen() < oldest->second.lastSeen()))
		{
			oldest = itr;
		}
	}
	if (oldest == mDevices.end())
	{
		return QString();
	}
	auto res = oldest->first;
	mDevices.erase(oldest);
	return res;
}





std::vector<DeviceIdentity> Discovery::devices() const
{
	std::vector<DeviceIdentity> res;
	QMutexLocker lock(&mMtxDevices);
	for (const auto & dev: mDevices)
	{
		res.push_back(dev.second);
	}
	return res;
}





void Discovery::broadcastIdentity()
{
	auto datagram = mComponents.get<LocalIdentity>()->identityPacket().serialize();

	// Broadcast the identity on all interfaces / addresses:
	for (const auto & addr: QNetworkInterface::allAddresses())
	{
		if ((addr.protocol() != QAbstractSocket::IPv4Protocol) || addr.isLoopback())
		{
			continue;
		}
		QUdpSocket socket;
		if (!socket.bind(addr))
		{
			mLogger.log("Cannot bind to %1 for broadcasting: %2", addr, socket.errorString());
			continue;
		}
		if (socket.writeDatagram(datagram, QHostAddress::Broadcast, Protocol::UDP_PORT) < 0)
		{
			mLogger.log("Broadcasting on %1 failed: %2", addr, socket.errorString());
		}
	}
}





void Discovery::socketReadyRead()
{
	while (mSocket.hasPendingDatagrams())
	{
		QByteArray data;
		data.resize(static_cast<int>(mSocket.pendingDatagramSize()));
		QHostAddress sender;
		auto numRead = mSocket.readDatagram(data.data(), data.size(), &sender);
		if (numRead < 0)
		{
			mLogger.log("Reading a datagram failed: %1", mSocket.errorString());
			return;
		}
		data.resize(static_cast<int>(numRead));
		processDatagram(data, sender, QDateTime::currentMSecsSinceEpoch());
	}
}
