#include "TlsConnection.hpp"
#include <atomic>
#include <QDateTime>
#include "../LocalIdentity.hpp"
#include "../Protocol.hpp"
#include "../TrustStore.hpp"
#include "TlsFilter.hpp"





const int TlsConnection::HANDSHAKE_TIMEOUT_MSEC;





/** Returns a new unique ID for a connection to / from the specified peer. */
static QByteArray makeConnectionID(const char * aDirectionTag, const QHostAddress & aAddress, quint16 aPort)
{
	static std::atomic<int> counter(0);
	return QString("%1-%2-%3_%4")
		.arg(aDirectionTag)
		.arg(counter.fetch_add(1))
		.arg(aAddress.toString())
		.arg(aPort)
		.toUtf8();
}





std::shared_ptr<TlsConnection> TlsConnection::connectTo(ComponentCollection & aComponents, const DeviceIdentity & aIdentity)
{
	auto socket = new QTcpSocket;
	auto res = std::make_shared<TlsConnection>(
		aComponents,
		makeConnectionID("Out", aIdentity.address(), aIdentity.tcpPort()),
		cdOutbound,
		socket
	);
	res->mDeviceId = aIdentity.deviceId();
	res->mLogger.log("Connecting to device %1 at %2:%3", aIdentity.deviceId(), aIdentity.address(), aIdentity.tcpPort());
	socket->connectToHost(aIdentity.address(), aIdentity.tcpPort());
	return res;
}





std::shared_ptr<TlsConnection> TlsConnection::fromAccepted(ComponentCollection & aComponents, QTcpSocket * aSocket)
{
	auto res = std::make_shared<TlsConnection>(
		aComponents,
		makeConnectionID("In", aSocket->peerAddress(), aSocket->peerPort()),
		cdInbound,
		aSocket
	);
	res->mLogger.log("Accepted a connection from %1:%2", aSocket->peerAddress(), aSocket->peerPort());
	res->setState(csHandshaking);
	return res;
}





TlsConnection::TlsConnection(
	ComponentCollection & aComponents,
	const QByteArray & aConnectionID,
	Direction aDirection,
	QTcpSocket * aSocket
):
	Super(aComponents, aConnectionID, aDirection),
	mSocket(aSocket)
{
	mSocket->setParent(this);
	connect(mSocket, &QTcpSocket::connected,    this, &TlsConnection::socketConnected);
	connect(mSocket, &QTcpSocket::readyRead,    this, &TlsConnection::socketReadyRead);
	connect(mSocket, &QTcpSocket::disconnected, this, &TlsConnection::socketDisconnected);
	connect(mSocket, static_cast<void (QAbstractSocket::*)(QAbstractSocket::SocketError)>(&QAbstractSocket::error), this,
		[this](QAbstractSocket::SocketError aError)
		{
			mLogger.log("Socket error %1: %2", static_cast<int>(aError), mSocket->errorString());
			socketDisconnected();
		}
	);
	connect(&mHandshakeTimer, &QTimer::timeout, this, &TlsConnection::handshakeTimedOut);
	mHandshakeTimer.setSingleShot(true);
	mHandshakeTimer.start(HANDSHAKE_TIMEOUT_MSEC);
}





TlsConnection::~TlsConnection()
{
	mSocket->disconnect(this);
	mSocket->abort();
}





void TlsConnection::sendPacket(const Packet & aPacket)
{
	if ((mState == csDisconnected) || (mTls == nullptr))
	{
		mLogger.log("Cannot send packet %1, the connection is not open", aPacket.type());
		return;
	}
	mLogger.log("Sending packet %1", aPacket.type());
	try
	{
		mTls->writePlain(aPacket.serialize());
	}
	catch (const TlsFilter::TlsError & exc)
	{
		mLogger.log("ERROR: Failed to send packet %1: %2", aPacket.type(), exc.what());
		terminate();
	}
}





void TlsConnection::terminate()
{
	if (mState == csDisconnected)
	{
		return;
	}

	// The signal handlers may release their references to this object:
	auto self = shared_from_this();

	mLogger.log("Terminating the connection");
	mHandshakeTimer.stop();
	mSocket->disconnect(this);
	mSocket->abort();
	setState(csDisconnected);
	if ((mTls != nullptr) && mTls->hasRejectedPeer())
	{
		emit untrustedCertificate(this, mTls->peerFingerprint());
	}
	emit disconnected(this);
}





void TlsConnection::processCleartextData(const QByteArray & aData)
{
	mCleartextData.append(aData);
	QByteArray line;
	if (!Packet::extractLine(mCleartextData, line))
	{
		if (mCleartextData.size() > Protocol::MAX_PACKET_SIZE)
		{
			mLogger.log("ERROR: The cleartext identity is too long, terminating");
			terminate();
		}
		return;
	}

	DeviceIdentity identity;
	try
	{
		auto packet = Packet::parse(line);
		identity = DeviceIdentity::fromIdentityPacket(packet, mSocket->peerAddress(), QDateTime::currentMSecsSinceEpoch());
	}
	catch (const Packet::MalformedPacketError & exc)
	{
		mLogger.log("ERROR: Invalid cleartext identity: %1", exc.what());
		terminate();
		return;
	}
	if (identity.protocolVersion() < Protocol::PROTOCOL_VERSION)
	{
		mLogger.log("ERROR: Device %1 uses an unsupported protocol version %2, refusing",
			identity.deviceId(), identity.protocolVersion()
		);
		terminate();
		return;
	}
	if (identity.deviceId() == mComponents.get<LocalIdentity>()->identity().deviceId())
	{
		mLogger.log("Refusing a connection from ourselves");
		terminate();
		return;
	}
	mLogger.log("Received cleartext identity of device %1 (%2)", identity.deviceId(), identity.name());
	mCleartextIdentity = identity;
	mDeviceId = identity.deviceId();

	auto leftover = mCleartextData;
	mCleartextData.clear();
	startTls(leftover);
}





void TlsConnection::startTls(const QByteArray & aLeftoverData)
{
	setState(csHandshaking);
	auto localIdentity = mComponents.get<LocalIdentity>();
	auto isClient = (mDirection == cdInbound);
	mLogger.log("Starting TLS as the %1", isClient ? "client" : "server");
	mTls = std::make_unique<TlsFilter>(*mSocket, mLogger);
	try
	{
		mTls->initialize(
			localIdentity->makeSslConfig(isClient),
			[this](const QString & aFingerprint)
			{
				return verifyPeer(aFingerprint);
			}
		);
		mTls->writePlain(localIdentity->identityPacket().serialize());
	}
	catch (const TlsFilter::TlsError & exc)
	{
		mLogger.log("ERROR: Failed to start TLS: %1", exc.what());
		terminate();
		return;
	}
	if (!aLeftoverData.isEmpty())
	{
		processTls(aLeftoverData);
	}
}





void TlsConnection::processTls(const QByteArray & aEncryptedData)
{
	QByteArray plain;
	try
	{
		plain = mTls->process(aEncryptedData);
	}
	catch (const TlsFilter::TlsError & exc)
	{
		mLogger.log("ERROR: TLS failed: %1", exc.what());
		terminate();
		return;
	}
	if (!plain.isEmpty())
	{
		processIncomingPlainData(plain);
	}
}





bool TlsConnection::verifyPeer(const QString & aFingerprint)
{
	if (mDeviceId.isEmpty())
	{
		mLogger.log("ERROR: Certificate received before the device ID is known");
		return false;
	}
	if (!mComponents.has(ComponentCollection::ckTrustStore))
	{
		return true;
	}
	try
	{
		auto verdict = mComponents.get<TrustStore>()->verify(mDeviceId, aFingerprint);
		if (verdict == TrustStore::tvMismatch)
		{
			mLogger.log("ERROR: Device %1 presented certificate %2, which is different from the paired one", mDeviceId, aFingerprint);
			return false;
		}
	}
	catch (const std::exception & exc)
	{
		// Called from within mbedTLS, exceptions must not propagate
		mLogger.log("ERROR: Failed to verify the certificate against the TrustStore: %1", exc.what());
		return false;
	}
	return true;
}





void TlsConnection::handlePreEstablishedPacket(const Packet & aPacket)
{
	if (aPacket.type() != Protocol::PACKET_TYPE_IDENTITY)
	{
		Super::handlePreEstablishedPacket(aPacket);
		return;
	}

	DeviceIdentity identity;
	try
	{
		identity = DeviceIdentity::fromIdentityPacket(aPacket, mSocket->peerAddress(), QDateTime::currentMSecsSinceEpoch());
	}
	catch (const Packet::MalformedPacketError & exc)
	{
		mLogger.log("ERROR: Invalid identity inside TLS: %1", exc.what());
		terminate();
		return;
	}
	if (identity.deviceId() != mDeviceId)
	{
		mLogger.log("ERROR: The device identifies as %1 inside TLS, but %2 was expected", identity.deviceId(), mDeviceId);
		terminate();
		return;
	}
	if (identity.protocolVersion() < Protocol::PROTOCOL_VERSION)
	{
		mLogger.log("ERROR: Device %1 uses an unsupported protocol version %2, refusing", mDeviceId, identity.protocolVersion());
		terminate();
		return;
	}
	mCertificateFingerprint = mTls->peerFingerprint();
	if (mCertificateFingerprint.isEmpty())
	{
		mLogger.log("ERROR: Device %1 hasn't presented any certificate, refusing", mDeviceId);
		terminate();
		return;
	}
	if ((identity.tcpPort() == 0) && mCleartextIdentity.isPresent())
	{
		identity.setTcpPort(mCleartextIdentity.value().tcpPort());
	}
	mHandshakeTimer.stop();
	setEstablished(identity);
}





void TlsConnection::socketConnected()
{
	mLogger.log("Connected, sending the cleartext identity");
	auto localIdentity = mComponents.get<LocalIdentity>();
	mSocket->write(localIdentity->identityPacket().serialize());
	startTls(QByteArray());
}





void TlsConnection::socketReadyRead()
{
	// The processing may release all other references to this object:
	auto self = shared_from_this();

	while (mState != csDisconnected)
	{
		char buf[4000];
		auto numBytes = mSocket->read(buf, sizeof(buf));
		if (numBytes == 0)
		{
			return;
		}
		else if (numBytes < 0)
		{
			mLogger.log("ERROR: Reading from the socket failed: %1", mSocket->errorString());
			terminate();
			return;
		}
		QByteArray data(buf, static_cast<int>(numBytes));
		if (mTls == nullptr)
		{
			processCleartextData(data);
		}
		else
		{
			processTls(data);
		}
	}
}





void TlsConnection::socketDisconnected()
{
	mLogger.log("The socket has been closed");
	terminate();
}





void TlsConnection::handshakeTimedOut()
{
	if (mState == csEstablished)
	{
		return;
	}
	mLogger.log("ERROR: The handshake hasn't completed in %1 msec, terminating", HANDSHAKE_TIMEOUT_MSEC);
	terminate();
}
