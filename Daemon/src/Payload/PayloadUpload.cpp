#include "PayloadUpload.hpp"
#include <algorithm>
#include <PolarSSL-cpp/SslConfig.h>
#include "../Comm/TlsFilter.hpp"
#include "../Protocol.hpp"





const int PayloadUpload::CHUNK_SIZE;





PayloadUpload::PayloadUpload(
	const QString & aDeviceId,
	const QString & aExpectedFingerprint,
	std::unique_ptr<QIODevice> && aSource,
	qint64 aSize,
	Logger & aLogger
):
	Super(aDeviceId, tdUpload, aSize, aLogger),
	mExpectedFingerprint(aExpectedFingerprint),
	mSource(std::move(aSource)),
	mPort(0),
	mSocket(nullptr),
	mIsSourceExhausted(false)
{
	connect(&mServer, &QTcpServer::newConnection, this, &PayloadUpload::serverNewConnection);
}





PayloadUpload::~PayloadUpload()
{
	if (mSocket != nullptr)
	{
		mSocket->disconnect(this);
		mSocket->abort();
	}
}





void PayloadUpload::listen(std::shared_ptr<SslConfig> aSslConfig)
{
	mSslConfig = aSslConfig;
	for (auto port = Protocol::MIN_PAYLOAD_PORT; port <= Protocol::MAX_PAYLOAD_PORT; ++port)
	{
		if (mServer.listen(QHostAddress::Any, port))
		{
			mPort = port;
			mLogger.log("Payload upload for device %1 listening on port %2, %3 bytes", mDeviceId, mPort, mSize);
			noteActivity();
			return;
		}
	}
	throw TransferError(mLogger, "No free port for the payload upload in the range %1 - %2",
		Protocol::MIN_PAYLOAD_PORT, Protocol::MAX_PAYLOAD_PORT
	);
}





QJsonObject PayloadUpload::transferInfo() const
{
	QJsonObject res;
	res.insert("port", mPort);
	return res;
}





void PayloadUpload::sendMoreData()
{
	if (mIsDone || (mTls == nullptr))
	{
		return;
	}
	if ((mTls->numPendingPlain() > 0) || (mSocket->bytesToWrite() > CHUNK_SIZE))
	{
		return;
	}
	if (mIsSourceExhausted)
	{
		if (mSocket->bytesToWrite() == 0)
		{
			setFinished();
		}
		return;
	}

	auto maxRead = CHUNK_SIZE;
	if (mSize >= 0)
	{
		maxRead = static_cast<int>(std::min<qint64>(CHUNK_SIZE, mSize - mNumTransferred));
	}
	QByteArray chunk;
	if (maxRead > 0)
	{
		chunk = mSource->read(maxRead);
	}
	if (chunk.isEmpty())
	{
		if ((mSize >= 0) && (mNumTransferred < mSize))
		{
			setFailed(TransferError("The source has ended after %1 of %2 bytes", mNumTransferred, mSize));
			return;
		}
		mIsSourceExhausted = true;
		if (mSocket->bytesToWrite() == 0)
		{
			setFinished();
		}
		return;
	}
	try
	{
		mTls->writePlain(chunk);
	}
	catch (const TlsFilter::TlsError & exc)
	{
		setFailed(TransferError("TLS failed while sending: %1", exc.what()));
		return;
	}
	mNumTransferred += chunk.size();
	noteActivity();
	emit progress(this, mNumTransferred);
}





void PayloadUpload::closeTransport()
{
	mServer.close();
	if (mSocket != nullptr)
	{
		mSocket->disconnect(this);
		if (hasSucceeded())
		{
			// Let the socket flush the rest of the data before closing:
			mSocket->disconnectFromHost();
		}
		else
		{
			mSocket->abort();
		}
	}
	if (mSource != nullptr)
	{
		mSource->close();
	}
}





void PayloadUpload::serverNewConnection()
{
	auto socket = mServer.nextPendingConnection();
	if (socket == nullptr)
	{
		return;
	}
	if (mSocket != nullptr)
	{
		mLogger.log("Refusing a second connection to the payload upload from %1", socket->peerAddress());
		socket->abort();
		socket->deleteLater();
		return;
	}
	mServer.close();
	mSocket = socket;
	mSocket->setParent(this);
	mLogger.log("Payload upload for device %1: accepted connection from %2", mDeviceId, mSocket->peerAddress());
	connect(mSocket, &QTcpSocket::readyRead,    this, &PayloadUpload::socketReadyRead);
	connect(mSocket, &QTcpSocket::bytesWritten, this, &PayloadUpload::socketBytesWritten);
	connect(mSocket, &QTcpSocket::disconnected, this, &PayloadUpload::socketDisconnected);

	mTls = std::make_unique<TlsFilter>(*mSocket, mLogger);
	try
	{
		auto expected = mExpectedFingerprint;
		mTls->initialize(mSslConfig,
			[expected](const QString & aFingerprint)
			{
				return (expected.isEmpty() || (aFingerprint == expected));
			}
		);
	}
	catch (const TlsFilter::TlsError & exc)
	{
		setFailed(TransferError("TLS failed to start: %1", exc.what()));
		return;
	}
	noteActivity();
	sendMoreData();
}





void PayloadUpload::socketReadyRead()
{
	auto data = mSocket->readAll();
	try
	{
		// The receiver doesn't send any payload data, only the TLS handshake and alerts:
		mTls->process(data);
	}
	catch (const TlsFilter::TlsError & exc)
	{
		setFailed(TransferError("TLS failed: %1", exc.what()));
		return;
	}
	sendMoreData();
}





void PayloadUpload::socketBytesWritten()
{
	noteActivity();
	sendMoreData();
}





void PayloadUpload::socketDisconnected()
{
	if (mIsSourceExhausted && (mTls != nullptr) && (mTls->numPendingPlain() == 0))
	{
		setFinished();
		return;
	}
	setFailed(TransferError("The device has closed the connection after %1 bytes", mNumTransferred));
}
