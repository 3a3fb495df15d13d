#pragma once

#include <map>
#include <vector>
#include <QObject>
#include <QReadWriteLock>
#include <QTimer>
#include "ComponentCollection.hpp"
#include "Device.hpp"
#include "Optional.hpp"
#include "PairingService.hpp"
#include "Comm/Connection.hpp"
#include "Plugins/PacketRouter.hpp"





/** The authoritative list of devices and their connection state machines.
Joins the other components together: takes the identities from Discovery, the established connections from
ConnectionMgr and the pairing outcomes from PairingService, and decides for each device whether it is
disconnected, connected, pairing or paired. Only a paired device's packets reach its plugins.
Also serves as the PacketRouter for the plugins, resolving the device ID to the device's current connection.
The device map is guarded by a read-write lock; no lock is held while emitting signals or calling into the
connections, plugins or other components. */
class DeviceMgr:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDeviceMgr>,
	public PacketRouter
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDeviceMgr>;

	Q_OBJECT


public:

	/** How often the reconnect schedule is checked. */
	static const int RECONNECT_CHECK_INTERVAL_MSEC = 1000;

	/** The number of untrusted devices that are neither connected nor announcing themselves, that are remembered.
	Beyond it, the ones seen the longest ago are forgotten. */
	static const size_t MAX_UNTRUSTED_LOST_DEVICES = 64;


	/** Creates a new instance for the local device ID (used for the duplicate-connection tie-break).
	aMaxBackoffMsec caps the delay between the reconnect attempts. */
	DeviceMgr(ComponentCollection & aComponents, const QString & aLocalDeviceId, qint64 aMaxBackoffMsec = 120000);

	virtual ~DeviceMgr() override;

	// ComponentCollection::ComponentBase override:
	/** Connects to the signals of Discovery, ConnectionMgr and PairingService (those that are present)
	and starts the reconnect timer. */
	virtual void start() override;

	/** Terminates all the connections and stops all the plugins. */
	void stop();

	/** Returns the snapshots of all the known devices. */
	std::vector<Device::Snapshot> devices() const;

	/** Returns the snapshot of the specified device, or an empty Optional if not known. */
	Optional<Device::Snapshot> device(const QString & aDeviceId) const;

	/** Returns the state of the specified device; dsDisconnected for unknown devices. */
	Device::State deviceState(const QString & aDeviceId) const;

	/** Returns the plugin host of the specified device, nullptr if the device is not paired. */
	PluginHostPtr pluginHost(const QString & aDeviceId) const;

	/** Terminates the connection to the device and disables its auto-reconnect. */
	void disconnectDevice(const QString & aDeviceId);

	/** Connects to the device, if not already connected, and re-enables its auto-reconnect. */
	void connectToDevice(const QString & aDeviceId);

	/** Requests pairing with the device.
	If the device is not connected, the request is sent as soon as a connection is established.
	Returns false if the device is unknown, already paired, or there's no PairingService. */
	bool requestPairing(const QString & aDeviceId);

	/** Accepts the pairing requested by the device, trusting the certificate of its current connection.
	Returns false if there's no such request, or the device is not connected. */
	bool acceptPairing(const QString & aDeviceId);

	/** Rejects the pairing requested by the device. */
	void rejectPairing(const QString & aDeviceId);

	/** Removes the trust of the device, notifying the device if it is connected. */
	void unpair(const QString & aDeviceId);

	/** Starts the connections of all the devices whose reconnect time has come, as of aNow (msec since epoch). */
	void checkReconnects(qint64 aNow);

	// PacketRouter overrides:
	virtual bool sendPacket(const QString & aDeviceId, const Packet & aPacket) override;
	virtual std::shared_ptr<PayloadTransfer> sendPacketWithPayload(
		const QString & aDeviceId,
		const Packet & aPacket,
		std::unique_ptr<QIODevice> && aSource,
		qint64 aSize
	) override;
	virtual std::shared_ptr<PayloadTransfer> receivePayload(
		const QString & aDeviceId,
		const Packet & aPacket,
		std::unique_ptr<QIODevice> && aDestination
	) override;


public slots:

	/** Takes over an established connection from ConnectionMgr.
	Resolves duplicate connections, checks the certificate against the TrustStore and enters either
	dsPaired or dsConnected. */
	void addConnection(ConnectionPtr aConnection);

	/** Discovery has found a new device (or a lost one is back). */
	void discoveryDeviceFound(const DeviceIdentity & aIdentity);

	/** Discovery has received a re-announcement of a known device. */
	void discoveryDeviceUpdated(const DeviceIdentity & aIdentity);

	/** Discovery hasn't heard from the device within the liveness timeout. */
	void discoveryDeviceLost(const QString & aDeviceId);

	/** An outbound connection has failed before it was established. */
	void connMgrConnectionFailed(const QString & aDeviceId);

	/** A connection was refused because of a certificate mismatch. */
	void connMgrUntrustedCertificate(const QString & aDeviceId, const QString & aFingerprint);


protected:

	QString mLocalDeviceId;

	qint64 mMaxBackoffMsec;

	/** All the known devices, by their ID.
	Protected against multithreaded access by mLock. */
	std::map<QString, DevicePtr> mDevices;

	/** Protects mDevices (and the Device objects within) against multithreaded access. */
	mutable QReadWriteLock mLock;

	/** Fires the periodic checkReconnects(). */
	QTimer mReconnectTimer;

	Logger & mLogger;


	/** Returns the device of the specified ID, nullptr if not known.
	Assumes mLock is held by the caller. */
	DevicePtr findDeviceLocked(const QString & aDeviceId) const;

	/** Returns the device using the specified connection, nullptr if none.
	Assumes mLock is held by the caller. */
	DevicePtr findDeviceByConnectionLocked(const Connection * aConnection) const;

	/** Returns the ID of the device that has initiated the connection. */
	QString initiatorOf(const Connection & aConnection) const;

	/** Creates the device's plugin host and moves the device into dsPaired. */
	void enterPaired(const QString & aDeviceId);

	/** Moves the device into the specified state, if it is in one of the aFromStates (any state, if empty).
	Emits connectionStateChanged() if the state has changed. */
	void changeState(const QString & aDeviceId, Device::State aNewState, std::vector<Device::State> aFromStates = {});

	/** Updates the device from the discovered identity, creates it if not known.
	Starts the connection if the device is trusted and disconnected. */
	void updateFromDiscovery(const DeviceIdentity & aIdentity, bool aIsNewlyFound);

	/** Returns the PairingService, nullptr if not present. */
	std::shared_ptr<PairingService> pairingService();

	/** Forgets the untrusted, disconnected and unreachable devices over MAX_UNTRUSTED_LOST_DEVICES,
	the least recently seen first. */
	void forgetExcessLostDevices();


protected slots:

	/** Routes a packet received on a device's connection. */
	void connPacketReceived(Connection * aConnection, const Packet & aPacket);

	/** A device's connection has been lost. */
	void connDisconnected(Connection * aConnection);

	/** Sends the pairing packet to the device. */
	void pairingPacketToSend(const QString & aDeviceId, const Packet & aPacket);

	/** The device has requested pairing. */
	void pairingRequestedByPeer(const QString & aDeviceId);

	/** A pairing has concluded. */
	void pairingFinished(const QString & aDeviceId, PairingService::PairingResult aResult);


signals:

	/** Emitted when a new device is found (by discovery or by an incoming connection), or a lost one is back. */
	void deviceDiscovered(const DeviceIdentity & aIdentity);

	/** Emitted when a device is no longer announcing itself. */
	void deviceLost(const QString & aDeviceId);

	/** Emitted when the device requests pairing; the user should call acceptPairing() or rejectPairing(). */
	void pairingRequested(const QString & aDeviceId);

	/** Emitted when a pairing has concluded. */
	void pairingResult(const QString & aDeviceId, PairingService::PairingResult aResult);

	/** Emitted whenever a device changes its state. */
	void connectionStateChanged(const QString & aDeviceId, Device::State aNewState);

	/** Emitted when a device presents a certificate different from the trusted one. */
	void untrustedCertificate(const QString & aDeviceId, const QString & aFingerprint);

	/** Emitted when an outbound connection to the device should be opened. Connected to ConnectionMgr. */
	void connectionRequested(const DeviceIdentity & aIdentity);
};
