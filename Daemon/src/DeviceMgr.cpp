#include "DeviceMgr.hpp"
#include <algorithm>
#include <QDateTime>
#include "Comm/ConnectionMgr.hpp"
#include "Discovery.hpp"
#include "Payload/PayloadTransfers.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "MultiLogger.hpp"
#include "Protocol.hpp"
#include "TrustStore.hpp"
#include "Utils.hpp"





const int DeviceMgr::RECONNECT_CHECK_INTERVAL_MSEC;
const size_t DeviceMgr::MAX_UNTRUSTED_LOST_DEVICES;





DeviceMgr::DeviceMgr(ComponentCollection & aComponents, const QString & aLocalDeviceId, qint64 aMaxBackoffMsec):
	ComponentSuper(aComponents),
	mLocalDeviceId(aLocalDeviceId),
	mMaxBackoffMsec(aMaxBackoffMsec),
	mLogger(aComponents.logger("DeviceMgr"))
{
	requireForStart(ComponentCollection::ckTrustStore);
	requireForStart(ComponentCollection::ckPairingService);
	requireForStart(ComponentCollection::ckPluginRegistry);
	requireForStart(ComponentCollection::ckConnectionMgr);
	connect(&mReconnectTimer, &QTimer::timeout, this,
		[this]()
		{
			checkReconnects(QDateTime::currentMSecsSinceEpoch());
		}
	);
}





DeviceMgr::~DeviceMgr()
{
	QWriteLocker lock(&mLock);
	for (auto & dev: mDevices)
	{
		if (dev.second->mConnection != nullptr)
		{
			dev.second->mConnection->disconnect(this);
		}
	}
	mDevices.clear();
}





void DeviceMgr::start()
{
	if (mComponents.has(ComponentCollection::ckDiscovery))
	{
		auto discovery = mComponents.get<Discovery>();
		connect(discovery.get(), &Discovery::deviceDiscovered, this, &DeviceMgr::discoveryDeviceFound);
		connect(discovery.get(), &Discovery::deviceUpdated,    this, &DeviceMgr::discoveryDeviceUpdated);
		connect(discovery.get(), &Discovery::deviceLost,       this, &DeviceMgr::discoveryDeviceLost);
	}
	if (mComponents.has(ComponentCollection::ckConnectionMgr))
	{
		auto connMgr = mComponents.get<ConnectionMgr>();
		connect(connMgr.get(), &ConnectionMgr::newConnection,        this, &DeviceMgr::addConnection);
		connect(connMgr.get(), &ConnectionMgr::connectionFailed,     this, &DeviceMgr::connMgrConnectionFailed);
		connect(connMgr.get(), &ConnectionMgr::untrustedCertificate, this, &DeviceMgr::connMgrUntrustedCertificate);
		connect(this, &DeviceMgr::connectionRequested, connMgr.get(), &ConnectionMgr::connectToDevice);
	}
	auto pairing = pairingService();
	if (pairing != nullptr)
	{
		connect(pairing.get(), &PairingService::packetToSend,     this, &DeviceMgr::pairingPacketToSend);
		connect(pairing.get(), &PairingService::pairingRequested, this, &DeviceMgr::pairingRequestedByPeer);
		connect(pairing.get(), &PairingService::pairingResult,    this, &DeviceMgr::pairingFinished);
	}
	mReconnectTimer.start(RECONNECT_CHECK_INTERVAL_MSEC);
}





void DeviceMgr::stop()
{
	mReconnectTimer.stop();
	std::vector<ConnectionPtr> conns;
	std::vector<PluginHostPtr> hosts;
	{
		QWriteLocker lock(&mLock);
		for (auto & dev: mDevices)
		{
			auto & device = dev.second;
			device->mIsAutoReconnectEnabled = false;
			device->mNextReconnectAt = 0;
			if (device->mConnection != nullptr)
			{
				conns.push_back(device->mConnection);
			}
			if (device->mPluginHost != nullptr)
			{
				hosts.push_back(device->mPluginHost);
			}
		}
	}
	mLogger.log("Stopping: terminating %1 connections", conns.size());
	for (auto & conn: conns)
	{
		conn->terminate();
	}
	for (auto & host: hosts)
	{
		host->stop();
	}
}





std::vector<Device::Snapshot> DeviceMgr::devices() const
{
	std::vector<Device::Snapshot> res;
	QReadLocker lock(&mLock);
	for (const auto & dev: mDevices)
	{
		res.push_back(dev.second->snapshot());
	}
	return res;
}





Optional<Device::Snapshot> DeviceMgr::device(const QString & aDeviceId) const
{
	QReadLocker lock(&mLock);
	auto device = findDeviceLocked(aDeviceId);
	if (device == nullptr)
	{
		return {};
	}
	return device->snapshot();
}





Device::State DeviceMgr::deviceState(const QString & aDeviceId) const
{
	QReadLocker lock(&mLock);
	auto device = findDeviceLocked(aDeviceId);
	if (device == nullptr)
	{
		return Device::dsDisconnected;
	}
	return device->mState;
}





PluginHostPtr DeviceMgr::pluginHost(const QString & aDeviceId) const
{
	QReadLocker lock(&mLock);
	auto device = findDeviceLocked(aDeviceId);
	if (device == nullptr)
	{
		return nullptr;
	}
	return device->mPluginHost;
}





void DeviceMgr::disconnectDevice(const QString & aDeviceId)
{
	ConnectionPtr conn;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if (device == nullptr)
		{
			mLogger.log("Cannot disconnect unknown device %1", aDeviceId);
			return;
		}
		device->mIsAutoReconnectEnabled = false;
		device->mShouldPairOnConnect = false;
		device->mNextReconnectAt = 0;
		conn = device->mConnection;
	}
	mLogger.log("Disconnecting device %1 on request, auto-reconnect disabled", aDeviceId);
	if (conn != nullptr)
	{
		conn->terminate();
	}
}





void DeviceMgr::connectToDevice(const QString & aDeviceId)
{
	DeviceIdentity identity;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if (device == nullptr)
		{
			mLogger.log("Cannot connect to unknown device %1", aDeviceId);
			return;
		}
		device->mIsAutoReconnectEnabled = true;
		device->mReconnectAttempts = 0;
		device->mNextReconnectAt = 0;
		if (device->mState != Device::dsDisconnected)
		{
			return;
		}
		if (!device->mIdentity.isConnectable())
		{
			mLogger.log("Cannot connect to device %1, its address is not known yet", aDeviceId);
			return;
		}
		device->mState = Device::dsConnecting;
		identity = device->mIdentity;
	}
	mLogger.log("Connecting to device %1 on request", aDeviceId);
	emit connectionStateChanged(aDeviceId, Device::dsConnecting);
	emit connectionRequested(identity);
}





bool DeviceMgr::requestPairing(const QString & aDeviceId)
{
	auto pairing = pairingService();
	if (pairing == nullptr)
	{
		mLogger.log("Cannot pair with device %1, there's no pairing service", aDeviceId);
		return false;
	}
	bool shouldConnect = false;
	DeviceIdentity identity;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if (device == nullptr)
		{
			mLogger.log("Cannot pair with unknown device %1", aDeviceId);
			return false;
		}
		if (device->mState == Device::dsPaired)
		{
			mLogger.log("Device %1 is already paired", aDeviceId);
			return false;
		}
		if (!device->isConnected())
		{
			device->mShouldPairOnConnect = true;
			device->mIsAutoReconnectEnabled = true;
			if ((device->mState == Device::dsDisconnected) && device->mIdentity.isConnectable())
			{
				device->mState = Device::dsConnecting;
				identity = device->mIdentity;
				shouldConnect = true;
			}
		}
	}
	if (shouldConnect)
	{
		mLogger.log("Pairing requested with device %1, connecting first", aDeviceId);
		emit connectionStateChanged(aDeviceId, Device::dsConnecting);
		emit connectionRequested(identity);
		return true;
	}
	if (deviceState(aDeviceId) == Device::dsConnecting)
	{
		mLogger.log("Pairing requested with device %1, will be sent once connected", aDeviceId);
		return true;
	}
	if (deviceState(aDeviceId) == Device::dsDisconnected)
	{
		mLogger.log("Pairing requested with device %1, will be sent once the device is seen", aDeviceId);
		return true;
	}
	auto snapshot = device(aDeviceId);
	auto fingerprint = snapshot.isPresent() ? snapshot.value().mCertificateFingerprint : QString();
	changeState(aDeviceId, Device::dsPairing, {Device::dsConnected, Device::dsPairing});
	pairing->requestPairing(aDeviceId, fingerprint);
	return true;
}





bool DeviceMgr::acceptPairing(const QString & aDeviceId)
{
	auto pairing = pairingService();
	if (pairing == nullptr)
	{
		return false;
	}
	QString fingerprint;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || !device->isConnected())
		{
			mLogger.log("Cannot accept pairing with device %1, it is not connected", aDeviceId);
			return false;
		}
		fingerprint = device->mConnection->certificateFingerprint();
	}
	return pairing->acceptPairing(aDeviceId, fingerprint);
}





void DeviceMgr::rejectPairing(const QString & aDeviceId)
{
	auto pairing = pairingService();
	if (pairing != nullptr)
	{
		pairing->rejectPairing(aDeviceId);
	}
}





void DeviceMgr::unpair(const QString & aDeviceId)
{
	auto pairing = pairingService();
	if (pairing != nullptr)
	{
		pairing->unpair(aDeviceId);
	}
	else
	{
		mComponents.get<TrustStore>()->remove(aDeviceId);
	}
}





void DeviceMgr::checkReconnects(qint64 aNow)
{
	std::vector<DeviceIdentity> toConnect;
	{
		QWriteLocker lock(&mLock);
		for (auto & dev: mDevices)
		{
			auto & device = dev.second;
			if (
				(device->mState != Device::dsDisconnected) ||
				!device->mIsAutoReconnectEnabled ||
				(device->mNextReconnectAt == 0) ||
				(device->mNextReconnectAt > aNow) ||
				!device->mIdentity.isConnectable()
			)
			{
				continue;
			}
			device->mState = Device::dsConnecting;
			device->mNextReconnectAt = 0;
			toConnect.push_back(device->mIdentity);
		}
	}
	for (const auto & identity: toConnect)
	{
		mLogger.log("Reconnecting to device %1", identity.deviceId());
		emit connectionStateChanged(identity.deviceId(), Device::dsConnecting);
		emit connectionRequested(identity);
	}
}





bool DeviceMgr::sendPacket(const QString & aDeviceId, const Packet & aPacket)
{
	ConnectionPtr conn;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || !device->isConnected())
		{
			return false;
		}
		conn = device->mConnection;
	}
	conn->sendPacket(aPacket);
	return true;
}





std::shared_ptr<PayloadTransfer> DeviceMgr::sendPacketWithPayload(
	const QString & aDeviceId,
	const Packet & aPacket,
	std::unique_ptr<QIODevice> && aSource,
	qint64 aSize
)
{
	if (!mComponents.has(ComponentCollection::ckPayloadTransfers))
	{
		mLogger.log("Cannot send a payload to device %1, payload transfers are not available", aDeviceId);
		return nullptr;
	}
	ConnectionPtr conn;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || !device->isConnected())
		{
			mLogger.log("Cannot send a payload to device %1, it is not connected", aDeviceId);
			return nullptr;
		}
		conn = device->mConnection;
	}
	std::shared_ptr<PayloadUpload> upload;
	try
	{
		upload = mComponents.get<PayloadTransfers>()->startUpload(
			aDeviceId, conn->certificateFingerprint(), std::move(aSource), aSize
		);
	}
	catch (const PayloadTransfer::TransferError & exc)
	{
		mLogger.log("Cannot send a payload to device %1: %2", aDeviceId, exc.what());
		return nullptr;
	}
	conn->sendPacket(aPacket.withPayload(aSize, upload->transferInfo()));
	return upload;
}





std::shared_ptr<PayloadTransfer> DeviceMgr::receivePayload(
	const QString & aDeviceId,
	const Packet & aPacket,
	std::unique_ptr<QIODevice> && aDestination
)
{
	if (!mComponents.has(ComponentCollection::ckPayloadTransfers))
	{
		mLogger.log("Cannot receive a payload from device %1, payload transfers are not available", aDeviceId);
		return nullptr;
	}
	auto port = aPacket.payloadPort();
	if (port == 0)
	{
		mLogger.log("Cannot receive the payload of packet %1 from device %2, no port announced", aPacket.type(), aDeviceId);
		return nullptr;
	}
	QHostAddress address;
	QString fingerprint;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || !device->isConnected())
		{
			mLogger.log("Cannot receive a payload from device %1, it is not connected", aDeviceId);
			return nullptr;
		}
		address = device->mIdentity.address();
		fingerprint = device->mConnection->certificateFingerprint();
	}
	return mComponents.get<PayloadTransfers>()->startDownload(
		aDeviceId, fingerprint, address, port, aPacket.payloadSize(), std::move(aDestination)
	);
}





void DeviceMgr::addConnection(ConnectionPtr aConnection)
{
	if ((aConnection->state() != Connection::csEstablished) || !aConnection->remoteIdentity().isPresent())
	{
		mLogger.log("Refusing connection %1, it is not established", aConnection->connectionID());
		aConnection->terminate();
		return;
	}
	auto identity = aConnection->remoteIdentity().value();
	const auto deviceId = identity.deviceId();
	const auto fingerprint = aConnection->certificateFingerprint();
	mLogger.log("New connection %1 to device %2 (%3), certificate %4",
		aConnection->connectionID(), deviceId, identity.name(), fingerprint
	);

	auto verdict = fingerprint.isEmpty() ?
		TrustStore::tvMismatch :
		mComponents.get<TrustStore>()->verify(deviceId, fingerprint);

	bool isNew = false;
	ConnectionPtr toTerminate;
	PluginHostPtr oldHost;
	bool shouldPair = false;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(deviceId);
		if (device == nullptr)
		{
			device = std::make_shared<Device>(identity);
			mDevices[deviceId] = device;
			isNew = true;
		}
		else
		{
			device->mIdentity.refresh(identity);
		}

		if (verdict == TrustStore::tvMismatch)
		{
			device->mIsAutoReconnectEnabled = false;
			device->mNextReconnectAt = 0;
			toTerminate = aConnection;
		}
		else if ((device->mConnection != nullptr) && (device->mConnection->state() != Connection::csDisconnected))
		{
			// Duplicate connection, keep the one initiated by the smaller device ID:
			const auto & preferredInitiator = Utils::smallerDeviceId(mLocalDeviceId, deviceId);
			auto isExistingPreferred = (initiatorOf(*device->mConnection) == preferredInitiator);
			auto isNewPreferred = (initiatorOf(*aConnection) == preferredInitiator);
			if (isExistingPreferred && !isNewPreferred)
			{
				toTerminate = aConnection;
			}
			else
			{
				toTerminate = device->mConnection;
				oldHost = device->mPluginHost;
				device->mPluginHost.reset();
				device->mNegotiatedCapabilities.clear();
			}
		}

		if (toTerminate != aConnection)
		{
			device->mConnection = aConnection;
			device->mState = Device::dsConnected;
			device->mReconnectAttempts = 0;
			device->mNextReconnectAt = 0;
			if ((verdict != TrustStore::tvTrusted) && device->mShouldPairOnConnect)
			{
				device->mShouldPairOnConnect = false;
				shouldPair = true;
			}
			connect(aConnection.get(), &Connection::packetReceived, this, &DeviceMgr::connPacketReceived);
			connect(aConnection.get(), &Connection::disconnected,   this, &DeviceMgr::connDisconnected);
		}
	}

	if (isNew)
	{
		emit deviceDiscovered(identity);
	}

	if (verdict == TrustStore::tvMismatch)
	{
		mLogger.log("ERROR: Device %1 presented certificate %2, which doesn't match the paired one; refusing the connection",
			deviceId, fingerprint
		);
		aConnection->terminate();
		emit untrustedCertificate(deviceId, fingerprint);
		return;
	}

	if (toTerminate != nullptr)
	{
		mLogger.log("Duplicate connection to device %1, terminating connection %2", deviceId, toTerminate->connectionID());
		toTerminate->disconnect(this);
		toTerminate->terminate();
		if (oldHost != nullptr)
		{
			oldHost->stop();
		}
		if (toTerminate == aConnection)
		{
			return;
		}
	}

	if (verdict == TrustStore::tvTrusted)
	{
		enterPaired(deviceId);
		return;
	}
	emit connectionStateChanged(deviceId, Device::dsConnected);
	if (shouldPair)
	{
		mLogger.log("Sending the pairing request postponed until the connection to device %1", deviceId);
		requestPairing(deviceId);
	}
}





void DeviceMgr::discoveryDeviceFound(const DeviceIdentity & aIdentity)
{
	updateFromDiscovery(aIdentity, true);
}





void DeviceMgr::discoveryDeviceUpdated(const DeviceIdentity & aIdentity)
{
	updateFromDiscovery(aIdentity, false);
}





void DeviceMgr::discoveryDeviceLost(const QString & aDeviceId)
{
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if (device != nullptr)
		{
			device->mIdentity.setReachable(false);
		}
	}
	mLogger.log("Device %1 is no longer announcing itself", aDeviceId);
	emit deviceLost(aDeviceId);
	forgetExcessLostDevices();
}





void DeviceMgr::connMgrConnectionFailed(const QString & aDeviceId)
{
	auto isTrusted = mComponents.get<TrustStore>()->isTrusted(aDeviceId);
	qint64 nextAttemptIn = 0;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || (device->mState != Device::dsConnecting))
		{
			return;
		}
		device->mState = Device::dsDisconnected;
		if (isTrusted && device->mIsAutoReconnectEnabled)
		{
			device->mReconnectAttempts += 1;
			nextAttemptIn = Device::backoffMsec(device->mReconnectAttempts, mMaxBackoffMsec);
			device->mNextReconnectAt = QDateTime::currentMSecsSinceEpoch() + nextAttemptIn;
		}
	}
	if (nextAttemptIn > 0)
	{
		mLogger.log("Connecting to device %1 has failed, retrying in %2 msec", aDeviceId, nextAttemptIn);
	}
	else
	{
		mLogger.log("Connecting to device %1 has failed", aDeviceId);
	}
	emit connectionStateChanged(aDeviceId, Device::dsDisconnected);
}





void DeviceMgr::connMgrUntrustedCertificate(const QString & aDeviceId, const QString & aFingerprint)
{
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if (device != nullptr)
		{
			device->mIsAutoReconnectEnabled = false;
			device->mNextReconnectAt = 0;
		}
	}
	mLogger.log("ERROR: Device %1 presented an untrusted certificate %2, auto-reconnect disabled", aDeviceId, aFingerprint);
	emit untrustedCertificate(aDeviceId, aFingerprint);
}





DevicePtr DeviceMgr::findDeviceLocked(const QString & aDeviceId) const
{
	auto itr = mDevices.find(aDeviceId);
	if (itr == mDevices.end())
	{
		return nullptr;
	}
	return itr->second;
}





DevicePtr DeviceMgr::findDeviceByConnectionLocked(const Connection * aConnection) const
{
	for (const auto & dev: mDevices)
	{
		if (dev.second->mConnection.get() == aConnection)
		{
			return dev.second;
		}
	}
	return nullptr;
}





QString DeviceMgr::initiatorOf(const Connection & aConnection) const
{
	return (aConnection.direction() == Connection::cdOutbound) ? mLocalDeviceId : aConnection.deviceId();
}





void DeviceMgr::enterPaired(const QString & aDeviceId)
{
	DeviceIdentity identity;
	ConnectionPtr conn;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || !device->isConnected())
		{
			mLogger.log("Cannot enter the paired state with device %1, it is not connected", aDeviceId);
			return;
		}
		if (device->mState == Device::dsPaired)
		{
			return;
		}
		identity = device->mIdentity;
		conn = device->mConnection;
	}

	// Negotiate and instantiate the plugins without holding the lock:
	PluginHostPtr host;
	if (mComponents.has(ComponentCollection::ckPluginRegistry))
	{
		host = mComponents.get<PluginRegistry>()->createHost(identity, *this);
	}
	else
	{
		host = std::make_shared<PluginHost>(aDeviceId, QStringList(), mComponents.get<MultiLogger>()->deviceLogger(aDeviceId));
	}

	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || (device->mConnection != conn) || (device->mState == Device::dsPaired))
		{
			// The connection has changed in the meantime
			return;
		}
		device->mPluginHost = host;
		device->mNegotiatedCapabilities = host->negotiatedCapabilities();
		device->mShouldPairOnConnect = false;
		device->mState = Device::dsPaired;
	}
	mLogger.log("Device %1 is paired, %2 plugins", aDeviceId, host->plugins().size());
	host->start();
	emit connectionStateChanged(aDeviceId, Device::dsPaired);
}





void DeviceMgr::changeState(const QString & aDeviceId, Device::State aNewState, std::vector<Device::State> aFromStates)
{
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(aDeviceId);
		if ((device == nullptr) || (device->mState == aNewState))
		{
			return;
		}
		if (
			!aFromStates.empty() &&
			(std::find(aFromStates.begin(), aFromStates.end(), device->mState) == aFromStates.end())
		)
		{
			return;
		}
		device->mState = aNewState;
	}
	emit connectionStateChanged(aDeviceId, aNewState);
}





void DeviceMgr::updateFromDiscovery(const DeviceIdentity & aIdentity, bool aIsNewlyFound)
{
	const auto & deviceId = aIdentity.deviceId();
	bool isNew = false;
	bool isCandidate = false;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(deviceId);
		if (device == nullptr)
		{
			device = std::make_shared<Device>(aIdentity);
			mDevices[deviceId] = device;
			isNew = true;
		}
		else
		{
			device->mIdentity.refresh(aIdentity);
		}
		isCandidate = (device->mState == Device::dsDisconnected) && device->mIsAutoReconnectEnabled;
	}
	if (isNew || aIsNewlyFound)
	{
		mLogger.log("Discovered device %1 (%2) at %3:%4",
			deviceId, aIdentity.name(), aIdentity.address(), aIdentity.tcpPort()
		);
		emit deviceDiscovered(aIdentity);
	}
	if (!isCandidate || !mComponents.get<TrustStore>()->isTrusted(deviceId))
	{
		return;
	}

	// A trusted device is in sight, connect right away:
	DeviceIdentity identity;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(deviceId);
		if ((device == nullptr) || (device->mState != Device::dsDisconnected) || !device->mIdentity.isConnectable())
		{
			return;
		}
		device->mState = Device::dsConnecting;
		device->mNextReconnectAt = 0;
		identity = device->mIdentity;
	}
	mLogger.log("Trusted device %1 is in sight, connecting", deviceId);
	emit connectionStateChanged(deviceId, Device::dsConnecting);
	emit connectionRequested(identity);
}





void DeviceMgr::forgetExcessLostDevices()
{
	// Collect the candidates, the trust is checked without holding the lock:
	std::vector<std::pair<qint64, QString>> candidates;  // (lastSeen, deviceId)
	{
		QReadLocker lock(&mLock);
		for (const auto & dev: mDevices)
		{
			const auto & device = *dev.second;
			if (
				(device.mState == Device::dsDisconnected) &&
				!device.mIdentity.isReachable() &&
				!device.mShouldPairOnConnect
			)
			{
				candidates.emplace_back(device.mIdentity.lastSeen(), dev.first);
			}
		}
	}
	if (candidates.size() <= MAX_UNTRUSTED_LOST_DEVICES)
	{
		return;
	}
	auto trustStore = mComponents.get<TrustStore>();
	candidates.erase(
		std::remove_if(candidates.begin(), candidates.end(),
			[&trustStore](const std::pair<qint64, QString> & aCandidate)
			{
				return trustStore->isTrusted(aCandidate.second);
			}
		),
		candidates.end()
	);
	if (candidates.size() <= MAX_UNTRUSTED_LOST_DEVICES)
	{
		return;
	}
	std::sort(candidates.begin(), candidates.end());
	candidates.resize(candidates.size() - MAX_UNTRUSTED_LOST_DEVICES);

	size_t numForgotten = 0;
	{
		QWriteLocker lock(&mLock);
		for (const auto & candidate: candidates)
		{
			auto itr = mDevices.find(candidate.second);
			if (
				(itr == mDevices.end()) ||
				(itr->second->mState != Device::dsDisconnected) ||
				itr->second->mIdentity.isReachable() ||
				itr->second->mShouldPairOnConnect
			)
			{
				// The device has come back in the meantime
				continue;
			}
			mDevices.erase(itr);
			numForgotten += 1;
		}
	}
	mLogger.log("Forgot %1 untrusted devices that have been lost the longest", numForgotten);
}





std::shared_ptr<PairingService> DeviceMgr::pairingService()
{
	if (!mComponents.has(ComponentCollection::ckPairingService))
	{
		return nullptr;
	}
	return mComponents.get<PairingService>();
}





void DeviceMgr::connPacketReceived(Connection * aConnection, const Packet & aPacket)
{
	QString deviceId;
	QString fingerprint;
	Device::State state;
	PluginHostPtr host;
	{
		QReadLocker lock(&mLock);
		auto device = findDeviceByConnectionLocked(aConnection);
		if (device == nullptr)
		{
			mLogger.log("Dropping packet %1 from connection %2, which belongs to no device",
				aPacket.type(), aConnection->connectionID()
			);
			return;
		}
		deviceId = device->deviceId();
		fingerprint = aConnection->certificateFingerprint();
		state = device->mState;
		host = device->mPluginHost;
	}

	if (aPacket.type() == Protocol::PACKET_TYPE_PAIR)
	{
		auto pairing = pairingService();
		if (pairing == nullptr)
		{
			mLogger.log("Dropping a pairing packet from device %1, there's no pairing service", deviceId);
			return;
		}
		pairing->handlePairPacket(deviceId, fingerprint, aPacket);
		return;
	}

	if (aPacket.type() == Protocol::PACKET_TYPE_IDENTITY)
	{
		DeviceIdentity identity;
		try
		{
			identity = DeviceIdentity::fromIdentityPacket(
				aPacket, QHostAddress(), QDateTime::currentMSecsSinceEpoch()
			);
		}
		catch (const Packet::MalformedPacketError & exc)
		{
			mLogger.log("Dropping an invalid identity from device %1: %2", deviceId, exc.what());
			return;
		}
		if (identity.deviceId() != deviceId)
		{
			mLogger.log("Dropping an identity of device %1 received from device %2", identity.deviceId(), deviceId);
			return;
		}
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(deviceId);
		if (device != nullptr)
		{
			// Keep the address of the connection:
			identity.setAddress(device->mIdentity.address());
			device->mIdentity.refresh(identity);
		}
		return;
	}

	if ((state != Device::dsPaired) || (host == nullptr))
	{
		mLogger.log("Dropping packet %1 from device %2, the device is not paired (%3)",
			aPacket.type(), deviceId, Device::stateToString(state)
		);
		return;
	}
	host->dispatch(aPacket);
}





void DeviceMgr::connDisconnected(Connection * aConnection)
{
	QString deviceId;
	PluginHostPtr host;
	ConnectionPtr conn;
	bool isAutoReconnectEnabled = false;
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceByConnectionLocked(aConnection);
		if (device == nullptr)
		{
			return;
		}
		deviceId = device->deviceId();
		conn = device->mConnection;
		host = device->mPluginHost;
		device->mConnection.reset();
		device->mPluginHost.reset();
		device->mNegotiatedCapabilities.clear();
		device->mState = Device::dsDisconnected;
		isAutoReconnectEnabled = device->mIsAutoReconnectEnabled;
	}
	mLogger.log("Connection %1 to device %2 has been lost", aConnection->connectionID(), deviceId);
	aConnection->disconnect(this);

	// Release the connection only after its signal handlers finish:
	QTimer::singleShot(0, this, [conn]() {});

	if (host != nullptr)
	{
		host->stop();
	}
	auto pairing = pairingService();
	if (pairing != nullptr)
	{
		pairing->cancel(deviceId);
	}

	if (isAutoReconnectEnabled && mComponents.get<TrustStore>()->isTrusted(deviceId))
	{
		QWriteLocker lock(&mLock);
		auto device = findDeviceLocked(deviceId);
		if ((device != nullptr) && (device->mState == Device::dsDisconnected))
		{
			device->mReconnectAttempts = 1;
			device->mNextReconnectAt = QDateTime::currentMSecsSinceEpoch() + Device::backoffMsec(1, mMaxBackoffMsec);
		}
	}
	emit connectionStateChanged(deviceId, Device::dsDisconnected);
}





void DeviceMgr::pairingPacketToSend(const QString & aDeviceId, const Packet & aPacket)
{
	if (!sendPacket(aDeviceId, aPacket))
	{
		mLogger.log("Cannot send the pairing packet to device %1, it is not connected", aDeviceId);
	}
}





void DeviceMgr::pairingRequestedByPeer(const QString & aDeviceId)
{
	mLogger.log("Device %1 requests pairing", aDeviceId);
	changeState(aDeviceId, Device::dsPairing, {Device::dsConnected});
	emit pairingRequested(aDeviceId);
}





void DeviceMgr::pairingFinished(const QString & aDeviceId, PairingService::PairingResult aResult)
{
	mLogger.log("Pairing with device %1 has finished: %2", aDeviceId, PairingService::resultToString(aResult));
	switch (aResult)
	{
		case PairingService::prAccepted:
		{
			// Store the friendly name along with the trust:
			auto trustStore = mComponents.get<TrustStore>();
			auto entry = trustStore->lookup(aDeviceId);
			auto snapshot = device(aDeviceId);
			if (entry.isPresent() && snapshot.isPresent())
			{
				auto e = entry.value();
				e.mFriendlyName = snapshot.value().mIdentity.name();
				trustStore->store(e);
			}
			if (snapshot.isPresent() &&
				(trustStore->verify(aDeviceId, snapshot.value().mCertificateFingerprint) == TrustStore::tvTrusted)
			)
			{
				enterPaired(aDeviceId);
			}
			break;
		}
		case PairingService::prRejected:
		case PairingService::prTimedOut:
		{
			changeState(aDeviceId, Device::dsConnected, {Device::dsPairing});
			break;
		}
		case PairingService::prUnpaired:
		{
			PluginHostPtr host;
			bool isConnected = false;
			{
				QWriteLocker lock(&mLock);
				auto device = findDeviceLocked(aDeviceId);
				if (device != nullptr)
				{
					host = device->mPluginHost;
					device->mPluginHost.reset();
					device->mNegotiatedCapabilities.clear();
					isConnected = device->isConnected();
				}
			}
			if (host != nullptr)
			{
				host->stop();
			}
			if (isConnected)
			{
				changeState(aDeviceId, Device::dsConnected, {Device::dsPaired, Device::dsPairing});
			}
			break;
		}
	}
	emit pairingResult(aDeviceId, aResult);
}
