#include "PayloadDownload.hpp"
#include <PolarSSL-cpp/SslConfig.h>
#include "../Comm/TlsFilter.hpp"





PayloadDownload::PayloadDownload(
	const QString & aDeviceId,
	qint64 aSize,
	std::unique_ptr<QIODevice> && aDestination,
	Logger & aLogger
):
	Super(aDeviceId, tdDownload, aSize, aLogger),
	mDestination(std::move(aDestination)),
	mSocket(nullptr)
{
}





PayloadDownload::~PayloadDownload()
{
	if (mSocket != nullptr)
	{
		mSocket->disconnect(this);
		mSocket->abort();
	}
}





void PayloadDownload::connectTo(
	std::shared_ptr<SslConfig> aSslConfig,
	const QHostAddress & aAddress,
	quint16 aPort,
	const QString & aExpectedFingerprint
)
{
	if (mSocket != nullptr)
	{
		throw LogicError(mLogger, "The payload download is already connecting");
	}
	mSslConfig = aSslConfig;
	mExpectedFingerprint = aExpectedFingerprint;
	mLogger.log("Payload download from device %1: connecting to %2:%3, %4 bytes", mDeviceId, aAddress, aPort, mSize);
	mSocket = new QTcpSocket(this);
	connect(mSocket, &QTcpSocket::connected,    this, &PayloadDownload::socketConnected);
	connect(mSocket, &QTcpSocket::readyRead,    this, &PayloadDownload::socketReadyRead);
	connect(mSocket, &QTcpSocket::disconnected, this, &PayloadDownload::socketDisconnected);
	connect(mSocket, static_cast<void (QAbstractSocket::*)(QAbstractSocket::SocketError)>(&QAbstractSocket::error),
		this, &PayloadDownload::socketError
	);
	noteActivity();
	mSocket->connectToHost(aAddress, aPort);
}





void PayloadDownload::feed(const QByteArray & aData)
{
	if (mIsDone || aData.isEmpty())
	{
		return;
	}
	if ((mSize >= 0) && (mNumTransferred + aData.size() > mSize))
	{
		setFailed(TransferError("Received more data than declared: %1 bytes instead of %2",
			mNumTransferred + aData.size(), mSize
		));
		return;
	}
	if (mDestination->write(aData) != aData.size())
	{
		setFailed(TransferError("Failed to write the received data: %1", mDestination->errorString()));
		return;
	}
	mNumTransferred += aData.size();
	noteActivity();
	emit progress(this, mNumTransferred);
	if (mNumTransferred == mSize)
	{
		setFinished();
	}
}





void PayloadDownload::streamFinished()
{
	if (mIsDone)
	{
		return;
	}
	if ((mSize < 0) || (mNumTransferred == mSize))
	{
		setFinished();
		return;
	}
	setFailed(TransferError("The connection has closed after %1 of %2 bytes", mNumTransferred, mSize));
}





void PayloadDownload::closeTransport()
{
	if (mSocket != nullptr)
	{
		mSocket->disconnect(this);
		mSocket->abort();
	}
	if (mDestination != nullptr)
	{
		mDestination->close();
	}
}





void PayloadDownload::socketConnected()
{
	mLogger.log("Payload download from device %1: connected, starting TLS", mDeviceId);
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
}





void PayloadDownload::socketReadyRead()
{
	if (mTls == nullptr)
	{
		return;
	}
	QByteArray plain;
	try
	{
		plain = mTls->process(mSocket->readAll());
	}
	catch (const TlsFilter::TlsError & exc)
	{
		setFailed(TransferError("TLS failed: %1", exc.what()));
		return;
	}
	noteActivity();
	feed(plain);
}





void PayloadDownload::socketDisconnected()
{
	streamFinished();
}





void PayloadDownload::socketError(QAbstractSocket::SocketError aError)
{
	if (aError == QAbstractSocket::RemoteHostClosedError)
	{
		// Handled by socketDisconnected()
		return;
	}
	setFailed(TransferError("Socket error %1: %2", static_cast<int>(aError), mSocket->errorString()));
}
