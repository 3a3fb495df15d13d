#pragma once

#include <memory>
#include <QObject>
#include "../ComponentCollection.hpp"
#include "../DeviceIdentity.hpp"
#include "../Optional.hpp"
#include "../Packet.hpp"





/** A single framed-packet connection to a remote device.
The transport-specific descendants (TlsConnection, the in-memory connections in tests) provide the bytes;
this class frames them into packets, counts the malformed ones and reports the connection lifecycle.
A connection starts in csInitial, goes through csHandshaking (certificate exchange and identity) and becomes
csEstablished once the remote identity and the certificate fingerprint are known. Any failure, at any stage,
ends in csDisconnected, reported by the disconnected() signal exactly once. */
class Connection:
	public QObject,
	public std::enable_shared_from_this<Connection>
{
	using Super = QObject;
	Q_OBJECT


public:

	enum State
	{
		csInitial,       ///< Nothing has been exchanged yet (outbound: not yet connected)
		csHandshaking,   ///< The identity and TLS handshake is in progress
		csEstablished,   ///< The remote identity and certificate are known, packets flow
		csDisconnected,  ///< The connection has been closed (but is kept for housekeeping)
	};


	enum Direction
	{
		cdOutbound,  ///< We have initiated the connection
		cdInbound,   ///< The remote has initiated the connection
	};


	/** The number of consecutive malformed packets after which the connection is terminated. */
	static const int MAX_CONSECUTIVE_MALFORMED = 3;


	Connection(
		ComponentCollection & aComponents,
		const QByteArray & aConnectionID,
		Direction aDirection,
		QObject * aParent = nullptr
	);

	virtual ~Connection() override {}

	// Simple getters:
	const QByteArray & connectionID() const { return mConnectionID; }
	Direction direction() const { return mDirection; }
	State state() const { return mState; }
	const Optional<DeviceIdentity> & remoteIdentity() const { return mRemoteIdentity; }
	const QString & certificateFingerprint() const { return mCertificateFingerprint; }

	/** Returns the ID of the remote device.
	Before the connection is established, returns the ID that the remote is expected to have (empty if unknown). */
	const QString & deviceId() const { return mDeviceId; }

	/** Sends the packet to the remote.
	Packets sent on a disconnected connection are logged and dropped. */
	virtual void sendPacket(const Packet & aPacket) = 0;

	/** Terminates the connection forcefully.
	Emits disconnected() if the connection wasn't disconnected already. */
	Q_INVOKABLE virtual void terminate() = 0;

	/** Returns the logger used for this connection. */
	Logger & logger() { return mLogger; }

	/** Translates the State into a string representation, used mainly for logging. */
	static QString stateToString(State aState);


protected:

	/** The components of the entire app. */
	ComponentCollection & mComponents;

	/** The unique identifier of the connection, used in the logs. */
	const QByteArray mConnectionID;

	Direction mDirection;

	/** The current state of the connection. */
	State mState;

	/** The identity received from the remote within the secured channel. */
	Optional<DeviceIdentity> mRemoteIdentity;

	/** The fingerprint of the certificate presented by the remote. */
	QString mCertificateFingerprint;

	/** The ID of the remote device (expected, until established). */
	QString mDeviceId;

	/** Buffer for the unprocessed incoming plain data.
	The data is stored here until a full packet line can be extracted; it is then removed from the buffer. */
	QByteArray mIncomingData;

	/** The number of malformed packets received in a row. */
	int mNumConsecutiveMalformed;

	/** The logger used for all messages produced by this connection. */
	Logger & mLogger;


	/** Sets the new state, emits the stateChanged() signal. */
	void setState(State aNewState);

	/** Marks the connection as established with the specified remote identity.
	Emits the established() signal. */
	void setEstablished(const DeviceIdentity & aRemoteIdentity);

	/** Frames the incoming plain data into packets.
	In csEstablished, the packets are emitted through packetReceived(); before that they are given to
	handlePreEstablishedPacket(). Malformed packets are logged and dropped, MAX_CONSECUTIVE_MALFORMED of them
	in a row, or an over-long unterminated line, terminate the connection. */
	void processIncomingPlainData(const QByteArray & aData);

	/** Handles a packet received before the connection is established.
	Descendants override to process the identity exchange; the default drops the packet. */
	virtual void handlePreEstablishedPacket(const Packet & aPacket);

	/** Returns the logger to use for a new connection with the specified ID. */
	static Logger & createLogger(ComponentCollection & aComponents, const QByteArray & aConnectionID);


signals:

	/** Emitted once the connection reaches csEstablished. */
	void established(Connection * aSelf);

	/** Emitted for each packet received on the established connection, in the order of arrival. */
	void packetReceived(Connection * aSelf, const Packet & aPacket);

	/** Emitted when the connection is lost or terminated. */
	void disconnected(Connection * aSelf);

	/** Emitted just before disconnected() if the remote presented a certificate that doesn't match the
	TrustStore entry for its device. */
	void untrustedCertificate(Connection * aSelf, const QString & aFingerprint);

	/** Emitted after the state has changed. */
	void stateChanged(Connection * aSelf, Connection::State aNewState);
};

using ConnectionPtr = std::shared_ptr<Connection>;

Q_DECLARE_METATYPE(Connection *);
Q_DECLARE_METATYPE(ConnectionPtr);
