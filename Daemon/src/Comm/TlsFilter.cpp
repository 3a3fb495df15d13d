#include "TlsFilter.hpp"
#include <algorithm>
#include <cstring>
#include <QIODevice>
#include <mbedtls/ssl.h>
#include <PolarSSL-cpp/SslConfig.h>
#include <PolarSSL-cpp/TlsException.h>
#include <PolarSSL-cpp/X509Cert.h>
#include "../Utils.hpp"





/** Returns true if the mbedTLS return code means "no error, try again later". */
static bool isWouldBlock(int aCode)
{
	return (aCode == MBEDTLS_ERR_SSL_WANT_READ) || (aCode == MBEDTLS_ERR_SSL_WANT_WRITE);
}





TlsFilter::TlsFilter(QIODevice & aIO, Logger & aLogger):
	mIO(aIO),
	mLogger(aLogger),
	mHasRejectedPeer(false)
{
}





TlsFilter::~TlsFilter()
{
	// Needed here, where the PolarSSL-cpp classes are complete
}





void TlsFilter::initialize(std::shared_ptr<SslConfig> aConfig, Verifier aVerifier)
{
	if (mTls != nullptr)
	{
		throw LogicError(mLogger, "TLS already initialized");
	}
	mVerifier = std::move(aVerifier);
	mConfig = std::move(aConfig);
	mConfig->setVerifyCallback(verifyCallback, this);
	mTls = std::make_unique<CallbackSslContext>(*this);
	mTls->initialize(mConfig);
	auto res = mTls->performHandshake();
	if ((res != 0) && !isWouldBlock(res))
	{
		throw TlsError(mLogger, "TLS handshake failed: -0x%1 (%2)",
			QString::number(-res, 16), TlsException::mbedTlsCodeToString(res)
		);
	}
}





void TlsFilter::writePlain(const QByteArray & aData)
{
	if (mTls == nullptr)
	{
		throw LogicError(mLogger, "TLS not initialized, cannot write");
	}
	mOutgoingDataPlain.append(aData);
	pump();
}





QByteArray TlsFilter::process(const QByteArray & aIncomingEncrypted)
{
	if (mTls == nullptr)
	{
		throw LogicError(mLogger, "TLS not initialized, cannot process incoming data");
	}
	mIncomingDataEncrypted.append(aIncomingEncrypted);
	return pump();
}





QByteArray TlsFilter::pump()
{
	QByteArray res;
	bool shouldLoop = true;
	while (shouldLoop)
	{
		shouldLoop = false;

		// Write the outgoing data, if possible:
		if (!mOutgoingDataPlain.isEmpty())
		{
			auto numWritten = mTls->writePlain(mOutgoingDataPlain.constData(), static_cast<size_t>(mOutgoingDataPlain.size()));
			if (numWritten > 0)
			{
				mOutgoingDataPlain.remove(0, numWritten);
				shouldLoop = true;
			}
			else if (!isWouldBlock(numWritten))
			{
				throw TlsError(mLogger, "TLS writing failed: -0x%1 (%2)",
					QString::number(-numWritten, 16), TlsException::mbedTlsCodeToString(numWritten)
				);
			}
		}

		// Read the incoming data, if possible:
		char buffer[3000];
		auto numRead = mTls->readPlain(buffer, sizeof(buffer));
		if (numRead > 0)
		{
			res.append(buffer, numRead);
			shouldLoop = true;
		}
		else if ((numRead != 0) && !isWouldBlock(numRead))
		{
			throw TlsError(mLogger, "TLS reading failed: -0x%1 (%2)",
				QString::number(-numRead, 16), TlsException::mbedTlsCodeToString(numRead)
			);
		}
	}
	return res;
}





int TlsFilter::verifyCallback(void * aUserData, mbedtls_x509_crt * aCurrentCert, int aChainDepth, uint32_t * aVerificationFlags)
{
	auto self = reinterpret_cast<TlsFilter *>(aUserData);

	// Self-signed certificates only ever have the leaf:
	if (aChainDepth != 0)
	{
		*aVerificationFlags = 0;
		return 0;
	}

	std::string pubKeyDer;
	try
	{
		pubKeyDer = X509Cert::fromContext(aCurrentCert)->publicKeyDer();
	}
	catch (const TlsException & exc)
	{
		self->mLogger.log("Failed to extract the peer's public key: %1.", exc.what());
		*aVerificationFlags = 0xffffffff;
		return -1;
	}
	self->mPeerFingerprint = Utils::fingerprintFromDer(QByteArray::fromStdString(pubKeyDer));
	self->mLogger.log("Peer certificate fingerprint: %1", self->mPeerFingerprint);
	if (self->mVerifier && !self->mVerifier(self->mPeerFingerprint))
	{
		self->mLogger.log("ERROR: The peer certificate has been REJECTED");
		self->mHasRejectedPeer = true;
		*aVerificationFlags = 0xffffffff;
		return -1;
	}

	// Self-signed, so the CA-based verification flags are meaningless:
	*aVerificationFlags = 0;
	return 0;
}





int TlsFilter::receiveEncrypted(unsigned char * aBuffer, size_t aNumBytes)
{
	if (mIncomingDataEncrypted.isEmpty())
	{
		return MBEDTLS_ERR_SSL_WANT_READ;
	}
	int numBytes = std::min(static_cast<int>(aNumBytes), mIncomingDataEncrypted.size());
	memcpy(aBuffer, mIncomingDataEncrypted.constData(), static_cast<size_t>(numBytes));
	mIncomingDataEncrypted.remove(0, numBytes);
	return numBytes;
}





int TlsFilter::sendEncrypted(const unsigned char * aBuffer, size_t aNumBytes)
{
	auto numWritten = mIO.write(reinterpret_cast<const char *>(aBuffer), static_cast<qint64>(aNumBytes));
	if (numWritten < 0)
	{
		return MBEDTLS_ERR_SSL_INTERNAL_ERROR;
	}
	return static_cast<int>(numWritten);
}
