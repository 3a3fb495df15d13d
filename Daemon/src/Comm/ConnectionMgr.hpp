#pragma once

#include <memory>
#include <vector>
#include <QObject>
#include <QMutex>
#include "../ComponentCollection.hpp"
#include "../DeviceIdentity.hpp"
#include "Connection.hpp"





/** Manages the connections that are still handshaking.
Receives the inbound connections from TcpListener and creates the outbound ones on request. Once a connection
is established, it is handed over to DeviceMgr through the newConnection() signal and no longer tracked here. */
class ConnectionMgr:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckConnectionMgr>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckConnectionMgr>;

	Q_OBJECT


public:

	explicit ConnectionMgr(ComponentCollection & aComponents);

	virtual ~ConnectionMgr() override;

	/** Returns a (shallow) copy of all the connections that are still handshaking. */
	std::vector<ConnectionPtr> connections() const;

	/** Adds the specified connection to the internal list of handshaking connections.
	To be called by the TcpListener when it accepts a new connection. */
	void addConnection(ConnectionPtr aConnection);

	/** Terminates all handshaking connections. */
	void stop();


public Q_SLOTS:

	/** Opens a new outbound connection to the specified device.
	The outcome is reported through newConnection(), connectionFailed() or untrustedCertificate(). */
	void connectToDevice(const DeviceIdentity & aIdentity);


protected:

	/** All handshaking connections.
	Protected against multithreaded access by mMtxConnections. */
	std::vector<ConnectionPtr> mConnections;

	/** The mutex protecting mConnections against multithreaded access. */
	mutable QMutex mMtxConnections;

	Logger & mLogger;


	/** Removes the connection from mConnections.
	The removal is postponed to the next event loop iteration, so that the connection object survives the
	signal handler that is currently running. */
	void removeConnection(Connection * aConnection);


signals:

	/** Emitted when a connection is fully established.
	Used by DeviceMgr to attach the connection to its device. */
	void newConnection(ConnectionPtr aConnection);

	/** Emitted when a connection to / from the specified device closes before it is established. */
	void connectionFailed(const QString & aDeviceId);

	/** Emitted when the device presents a certificate that doesn't match its TrustStore entry. */
	void untrustedCertificate(const QString & aDeviceId, const QString & aFingerprint);


protected slots:

	/** Removes the connection from the list and emits the newConnection() signal. */
	void connEstablished(Connection * aConnection);

	/** Removes the connection from the list and emits the connectionFailed() signal. */
	void connDisconnected(Connection * aConnection);

	/** Relays the connection's untrustedCertificate() signal. */
	void connUntrustedCertificate(Connection * aConnection, const QString & aFingerprint);
};
