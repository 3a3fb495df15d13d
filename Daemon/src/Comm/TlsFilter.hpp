#pragma once

#include <functional>
#include <memory>
#include <QByteArray>
#include <QString>
#include <PolarSSL-cpp/CallbackSslContext.h>
#include "../Exception.hpp"





// fwd:
class QIODevice;
class SslConfig;





/** Runs the TLS protocol over a QIODevice, using PolarSSL-cpp's pull-based CallbackSslContext.
The encrypted data received from the IO is pushed in through process(), which returns the decrypted data.
The plain data to send is pushed in through writePlain(); it is encrypted and written to the IO as soon as
the TLS state allows.
The peer certificate is checked by the verifier given to initialize(), based on the peer's public key
fingerprint (see Utils::fingerprintFromDer()). */
class TlsFilter:
	public CallbackSslContext::DataCallbacks
{
public:

	/** Thrown when the TLS layer fails (handshake failure, rejected certificate, corrupted data). */
	class TlsError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Decides whether the peer with the specified certificate fingerprint is acceptable. */
	using Verifier = std::function<bool(const QString & aFingerprint)>;


	/** Creates a new filter that writes the encrypted data to aIO and logs into aLogger. */
	TlsFilter(QIODevice & aIO, Logger & aLogger);

	virtual ~TlsFilter() override;

	/** Sets up the TLS context with the specified config and starts the handshake.
	The aVerifier is consulted for the peer certificate during the handshake.
	Throws a TlsError if the handshake fails immediately. */
	void initialize(std::shared_ptr<SslConfig> aConfig, Verifier aVerifier);

	/** Queues the plain data for encryption and sends as much as possible.
	Throws a TlsError on TLS failure. */
	void writePlain(const QByteArray & aData);

	/** Pushes the encrypted data received from the IO into TLS, and returns the decrypted data
	(possibly empty, for example while handshaking).
	Throws a TlsError on TLS failure. */
	QByteArray process(const QByteArray & aIncomingEncrypted);

	/** Returns the fingerprint of the peer's certificate, empty if the peer hasn't presented any (yet). */
	const QString & peerFingerprint() const { return mPeerFingerprint; }

	/** Returns the number of plain bytes queued by writePlain() that TLS hasn't accepted yet. */
	int numPendingPlain() const { return mOutgoingDataPlain.size(); }

	/** Returns true if the verifier has rejected the peer certificate. */
	bool hasRejectedPeer() const { return mHasRejectedPeer; }


protected:

	/** The IO where the encrypted data is written. */
	QIODevice & mIO;

	Logger & mLogger;

	/** The TLS context, created in initialize(). */
	std::unique_ptr<CallbackSslContext> mTls;

	/** The config kept alive for the mTls. */
	std::shared_ptr<SslConfig> mConfig;

	/** Decides about the peer certificate. */
	Verifier mVerifier;

	/** The encrypted data received from the IO, not yet consumed by TLS. */
	QByteArray mIncomingDataEncrypted;

	/** The plain data that has not yet been accepted by TLS for sending. */
	QByteArray mOutgoingDataPlain;

	/** The fingerprint of the peer's public key, set when verifying its certificate. */
	QString mPeerFingerprint;

	/** Set when mVerifier refuses the peer. */
	bool mHasRejectedPeer;


	/** Pumps the data through TLS until neither direction can make progress.
	Returns the decrypted data. */
	QByteArray pump();

	/** Checks the peer certificate, called by mbedTLS during the handshake. */
	static int verifyCallback(void * aUserData, mbedtls_x509_crt * aCurrentCert, int aChainDepth, uint32_t * aVerificationFlags);

	// CallbackSslContext::DataCallbacks overrides:
	virtual int receiveEncrypted(unsigned char * aBuffer, size_t aNumBytes) override;
	virtual int sendEncrypted(const unsigned char * aBuffer, size_t aNumBytes) override;
};
