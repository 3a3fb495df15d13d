#pragma once

#include <map>
#include <vector>
#include <QObject>
#include <QMutex>
#include <QTimer>
#include <QUdpSocket>
#include "ComponentCollection.hpp"
#include "DeviceIdentity.hpp"





/** The UDP announce / listen loop.
Periodically broadcasts our identity packet on Protocol::UDP_PORT and listens for the identity packets of
other devices on the same port. Keeps the last known identity of each device that has announced itself;
a device that hasn't re-announced within the liveness timeout is reported lost (once), but kept.
Anyone on the LAN can announce any number of device IDs, so the number of kept devices is limited: only the
MAX_LOST_DEVICES most recently seen lost devices are kept, and a new device beyond MAX_DEVICES pushes out the
least recently seen one.
Discovery knows nothing about pairing or connections, it only emits the signals. */
class Discovery:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDiscovery>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDiscovery>;

	Q_OBJECT


public:

	/** The number of lost devices that are remembered. */
	static const size_t MAX_LOST_DEVICES = 64;

	/** The number of devices remembered in total, reachable or not. */
	static const size_t MAX_DEVICES = 512;


	/** Creates a new instance that ignores the announcements of aLocalDeviceId (our own broadcasts). */
	Discovery(ComponentCollection & aComponents, const QString & aLocalDeviceId, int aLivenessTimeoutMsec = 30000);

	// ComponentCollection::ComponentBase override:
	/** Binds the UDP socket and starts broadcasting. */
	virtual void start() override;

	/** Stops broadcasting and listening. */
	void stop();

	/** Processes a single datagram received from aSender at time aNow (msec since epoch).
	Non-identity packets, malformed datagrams and our own announcements are ignored. */
	void processDatagram(const QByteArray & aData, const QHostAddress & aSender, qint64 aNow);

	/** Reports the devices that haven't announced themselves within the liveness timeout, as of aNow. */
	void checkLiveness(qint64 aNow);

	/** Returns the identities of all the devices ever discovered. */
	std::vector<DeviceIdentity> devices() const;


protected:

	/** The ID of our own device, whose announcements are ignored. */
	QString mLocalDeviceId;

	/** How long a device may stay silent before it's reported lost. */
	int mLivenessTimeoutMsec;

	/** The identities of all the devices discovered so far, by their ID.
	Protected against multithreaded access by mMtxDevices. */
	std::map<QString, DeviceIdentity> mDevices;

	/** Protects mDevices against multithreaded access. */
	mutable QMutex mMtxDevices;

	/** The socket receiving the broadcasts. */
	QUdpSocket mSocket;

	/** Fires the periodic broadcasts. */
	QTimer mBroadcastTimer;

	/** Fires the periodic liveness checks. */
	QTimer mLivenessTimer;

	Logger & mLogger;


	/** Removes the least recently seen device from mDevices, considering only the lost ones if aLostOnly is set.
	Returns the ID of the removed device, empty if there was no candidate.
	Assumes mMtxDevices is held by the caller. */
	QString forgetLeastRecentLocked(bool aLostOnly);


protected slots:

	/** Broadcasts our identity on all the IPv4 interfaces. */
	void broadcastIdentity();

	/** Reads all the pending datagrams from mSocket. */
	void socketReadyRead();


signals:

	/** Emitted when a device announces itself for the first time, or after it has been lost. */
	void deviceDiscovered(const DeviceIdentity & aIdentity);

	/** Emitted when a known, reachable device re-announces itself. */
	void deviceUpdated(const DeviceIdentity & aIdentity);

	/** Emitted when a device hasn't announced itself within the liveness timeout. */
	void deviceLost(const QString & aDeviceId);
};
