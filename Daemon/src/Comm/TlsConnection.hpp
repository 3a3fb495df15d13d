#pragma once

#include <memory>
#include <QTcpSocket>
#include <QTimer>
#include "Connection.hpp"





// fwd:
class TlsFilter;





/** A Connection over TCP, secured by TLS with mutually exchanged self-signed certificates.
The side that initiated the TCP connection sends its identity packet in cleartext and then acts as the TLS
server; the accepting side reads that identity line and then acts as the TLS client. Inside TLS, both sides
send their identity again; the connection is established once the remote's inner identity arrives, matches
the device ID it has announced in cleartext (or the one we connected to), and the remote has presented a
certificate that the TrustStore doesn't contradict. */
class TlsConnection:
	public Connection
{
	using Super = Connection;
	Q_OBJECT


public:

	/** The time allowed for the whole handshake (TCP connect, identities, TLS). */
	static const int HANDSHAKE_TIMEOUT_MSEC = 10000;


	/** Creates a new outbound connection to the specified device and starts connecting. */
	static std::shared_ptr<TlsConnection> connectTo(ComponentCollection & aComponents, const DeviceIdentity & aIdentity);

	/** Creates a new inbound connection over the socket accepted by the TcpListener.
	Takes ownership of the socket. */
	static std::shared_ptr<TlsConnection> fromAccepted(ComponentCollection & aComponents, QTcpSocket * aSocket);

	TlsConnection(
		ComponentCollection & aComponents,
		const QByteArray & aConnectionID,
		Direction aDirection,
		QTcpSocket * aSocket
	);

	virtual ~TlsConnection() override;

	// Connection overrides:
	virtual void sendPacket(const Packet & aPacket) override;
	virtual void terminate() override;

	/** Returns the address of the remote peer. */
	QHostAddress peerAddress() const { return mSocket->peerAddress(); }


protected:

	/** The socket used for the transport. Owned by this object (QObject child). */
	QTcpSocket * mSocket;

	/** The TLS layer, created once the cleartext identity phase is over. */
	std::unique_ptr<TlsFilter> mTls;

	/** Terminates the connection if the handshake doesn't complete in time. */
	QTimer mHandshakeTimer;

	/** The identity that the remote has sent in cleartext (inbound only). */
	Optional<DeviceIdentity> mCleartextIdentity;

	/** The unprocessed cleartext data received before the TLS starts (inbound only). */
	QByteArray mCleartextData;


	/** Parses the cleartext identity line of an inbound connection, then starts the TLS. */
	void processCleartextData(const QByteArray & aData);

	/** Starts the TLS layer in the role given by the direction, sends our inner identity and pushes
	aLeftoverData (received after the cleartext identity) into the TLS. */
	void startTls(const QByteArray & aLeftoverData);

	/** Pushes the received encrypted data through TLS and frames the result into packets.
	Terminates the connection on TLS failure. */
	void processTls(const QByteArray & aEncryptedData);

	/** Checks the remote certificate against the TrustStore.
	Returns false (rejecting the handshake) if the TrustStore has a different fingerprint for the device. */
	bool verifyPeer(const QString & aFingerprint);

	// Connection override:
	virtual void handlePreEstablishedPacket(const Packet & aPacket) override;


private slots:

	/** The outbound TCP connection has been established, sends the cleartext identity and starts TLS. */
	void socketConnected();

	/** Reads all the data available in the socket and processes it according to the current phase. */
	void socketReadyRead();

	/** The socket has been closed or has failed. */
	void socketDisconnected();

	/** The handshake hasn't completed within HANDSHAKE_TIMEOUT_MSEC. */
	void handshakeTimedOut();
};
