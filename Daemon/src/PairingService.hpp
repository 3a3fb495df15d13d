#pragma once

#include <map>
#include <QObject>
#include <QMutex>
#include <QTimer>
#include "ComponentCollection.hpp"
#include "Packet.hpp"





/** The per-device pairing state machines.
Pairing exchanges kdeconnect.pair packets over an already established connection:
a request is {"pair": true, "timestamp": <sec>}, an accept is {"pair": true}, and {"pair": false} rejects a
request, cancels our own request, or unpairs an already paired device.
The outcome of each pairing is recorded in the TrustStore (the peer's certificate fingerprint).
The service doesn't own any connection; the outgoing packets are emitted through packetToSend(), the incoming ones
are fed in through handlePairPacket(). */
class PairingService:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckPairingService>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckPairingService>;

	Q_OBJECT


public:

	/** The outcome of a pairing, reported through pairingResult(). */
	enum PairingResult
	{
		prAccepted,  ///< Both sides agreed, the device is now trusted
		prRejected,  ///< One of the sides has refused (or cancelled) the pairing
		prTimedOut,  ///< No answer within the timeout
		prUnpaired,  ///< A previously trusted device is no longer trusted
	};


	/** The pending-pairing state of a single device. */
	enum PairingState
	{
		psNone,             ///< No pairing in progress
		psRequested,        ///< We've sent a request, waiting for the answer
		psRequestedByPeer,  ///< The peer has sent a request, waiting for the local user's decision
	};


	/** Creates a new instance for the device with the specified local ID.
	The local ID decides the tie-break when both sides request pairing at the same time. */
	PairingService(ComponentCollection & aComponents, const QString & aLocalDeviceId, int aTimeoutMsec = 30000);

	// ComponentCollection::ComponentBase override:
	/** Starts the periodic timeout checks. */
	virtual void start() override;

	/** Sends a pairing request to the device and starts the timeout.
	If the device has already requested pairing itself, accepts that request instead, trusting aFingerprint
	(the certificate of the device's current connection). */
	void requestPairing(const QString & aDeviceId, const QString & aFingerprint);

	/** Accepts the pairing requested by the device, trusting the specified certificate fingerprint.
	Returns false (and does nothing) if the device hasn't requested pairing. */
	bool acceptPairing(const QString & aDeviceId, const QString & aFingerprint);

	/** Rejects the pairing requested by the device.
	Also makes sure the device is not trusted. */
	void rejectPairing(const QString & aDeviceId);

	/** Removes the trust of the device and notifies the device. */
	void unpair(const QString & aDeviceId);

	/** Processes a kdeconnect.pair packet received from the device, over a connection where the device presented
	the certificate with the specified fingerprint. */
	void handlePairPacket(const QString & aDeviceId, const QString & aFingerprint, const Packet & aPacket);

	/** Drops the pending pairing state of the device, without sending anything.
	Used when the connection to the device is lost. */
	void cancel(const QString & aDeviceId);

	/** Fails all the pending pairings older than the timeout, as of aNow (msec since epoch). */
	void checkTimeouts(qint64 aNow);

	/** Returns true if the device is trusted. */
	bool isPaired(const QString & aDeviceId);

	/** Returns the pending-pairing state of the device. */
	PairingState pairingState(const QString & aDeviceId) const;

	/** Returns the string representation of the result, for logging. */
	static QString resultToString(PairingResult aResult);


protected:

	/** A pairing in progress. */
	struct Pending
	{
		PairingState mState;

		/** When the pairing times out, msec since epoch. */
		qint64 mDeadline;
	};


	QString mLocalDeviceId;

	int mTimeoutMsec;

	/** The pairings in progress, by device ID.
	Protected against multithreaded access by mMtx. */
	std::map<QString, Pending> mPending;

	/** Protects mPending against multithreaded access. */
	mutable QMutex mMtx;

	/** Fires the periodic checkTimeouts(). */
	QTimer mTimer;

	Logger & mLogger;


	/** Returns the kdeconnect.pair packet with the specified flag, and timestamp if it's a request. */
	static Packet makePairPacket(bool aPair, bool aIsRequest);

	/** Records the device as trusted with the specified fingerprint. */
	void trust(const QString & aDeviceId, const QString & aFingerprint);

	/** Sets the pending state of the device; psNone removes the device from mPending. */
	void setPending(const QString & aDeviceId, PairingState aState);


signals:

	/** Emitted when a pairing packet should be sent to the device. */
	void packetToSend(const QString & aDeviceId, const Packet & aPacket);

	/** Emitted when the device requests pairing; the local user should accept or reject it. */
	void pairingRequested(const QString & aDeviceId);

	/** Emitted when the pairing with the device has concluded. */
	void pairingResult(const QString & aDeviceId, PairingService::PairingResult aResult);
};

Q_DECLARE_METATYPE(PairingService::PairingResult);
