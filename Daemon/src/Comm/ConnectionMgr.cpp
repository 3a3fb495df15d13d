#include "ConnectionMgr.hpp"
#include <algorithm>
#include <QTimer>
#include "TlsConnection.hpp"





ConnectionMgr::ConnectionMgr(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("ConnectionMgr"))
{
	requireForStart(ComponentCollection::ckLocalIdentity);
	requireForStart(ComponentCollection::ckTrustStore);
}





ConnectionMgr::~ConnectionMgr()
{
	mLogger.log("Removing all connections...");
	QMutexLocker lock(&mMtxConnections);
	for (auto & conn: mConnections)
	{
		conn->disconnect(this);
	}
	mConnections.clear();
	mLogger.log("Connections removed.");
}





std::vector<ConnectionPtr> ConnectionMgr::connections() const
{
	QMutexLocker lock(&mMtxConnections);
	return mConnections;
}





void ConnectionMgr::addConnection(ConnectionPtr aConnection)
{
	mLogger.log("Adding a new connection, id = %1.", aConnection->connectionID());
	connect(aConnection.get(), &Connection::established,          this, &ConnectionMgr::connEstablished);
	connect(aConnection.get(), &Connection::disconnected,         this, &ConnectionMgr::connDisconnected);
	connect(aConnection.get(), &Connection::untrustedCertificate, this, &ConnectionMgr::connUntrustedCertificate);

	QMutexLocker lock(&mMtxConnections);
	mConnections.push_back(aConnection);
}





void ConnectionMgr::stop()
{
	mLogger.log("Terminating all handshaking connections...");
	auto conns = connections();
	for (auto & conn: conns)
	{
		conn->terminate();
	}
	mLogger.log("Connections terminated.");
}





void ConnectionMgr::connectToDevice(const DeviceIdentity & aIdentity)
{
	if (!aIdentity.isConnectable())
	{
		mLogger.log("Cannot connect to device %1, its address is not known", aIdentity.deviceId());
		emit connectionFailed(aIdentity.deviceId());
		return;
	}
	mLogger.log("Connecting to device %1", aIdentity.deviceId());
	addConnection(TlsConnection::connectTo(mComponents, aIdentity));
}





void ConnectionMgr::removeConnection(Connection * aConnection)
{
	ConnectionPtr conn;
	{
		QMutexLocker lock(&mMtxConnections);
		auto itr = std::find_if(mConnections.begin(), mConnections.end(),
			[aConnection](const ConnectionPtr & aConn)
			{
				return (aConn.get() == aConnection);
			}
		);
		if (itr == mConnections.end())
		{
			return;
		}
		conn = *itr;
		mConnections.erase(itr);
	}
	conn->disconnect(this);

	// Release the last reference only after the current signal handler finishes:
	QTimer::singleShot(0, this, [conn]() {});
}





void ConnectionMgr::connEstablished(Connection * aConnection)
{
	mLogger.log("Connection established, id = %1, device %2.", aConnection->connectionID(), aConnection->deviceId());
	auto conn = aConnection->shared_from_this();
	removeConnection(aConnection);
	emit newConnection(conn);
}





void ConnectionMgr::connDisconnected(Connection * aConnection)
{
	mLogger.log("Connection %1 closed before it was established.", aConnection->connectionID());
	auto deviceId = aConnection->deviceId();
	removeConnection(aConnection);
	if (!deviceId.isEmpty())
	{
		emit connectionFailed(deviceId);
	}
}





void ConnectionMgr::connUntrustedCertificate(Connection * aConnection, const QString & aFingerprint)
{
	mLogger.log("Connection %1: device %2 presented an untrusted certificate %3.",
		aConnection->connectionID(), aConnection->deviceId(), aFingerprint
	);
	emit untrustedCertificate(aConnection->deviceId(), aFingerprint);
}
