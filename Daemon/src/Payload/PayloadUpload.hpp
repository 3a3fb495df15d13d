#pragma once

#include <memory>
#include <QIODevice>
#include <QJsonObject>
#include <QTcpServer>
#include <QTcpSocket>
#include "PayloadTransfer.hpp"





// fwd:
class SslConfig;
class TlsFilter;





/** The sending side of a payload transfer.
Listens on the first free port in the payload range, accepts a single connection from the device, runs TLS as
the server and streams the source data; the transfer finishes once all the data is handed to the socket. */
class PayloadUpload:
	public PayloadTransfer
{
	using Super = PayloadTransfer;

	Q_OBJECT


public:

	/** The amount of data read from the source at once. */
	static const int CHUNK_SIZE = 64 * 1024;


	/** Creates a new upload of aSize bytes from aSource (already open for reading) to the specified device.
	Only the peer presenting aExpectedFingerprint is accepted (any peer, if empty). */
	PayloadUpload(
		const QString & aDeviceId,
		const QString & aExpectedFingerprint,
		std::unique_ptr<QIODevice> && aSource,
		qint64 aSize,
		Logger & aLogger
	);

	virtual ~PayloadUpload() override;

	/** Starts listening for the device's connection; the TLS sessions will use aSslConfig (server role).
	Throws a TransferError if there's no free port in the payload range. */
	void listen(std::shared_ptr<SslConfig> aSslConfig);

	/** Returns the port on which the upload listens, 0 if not listening. */
	quint16 port() const { return mPort; }

	/** Returns the payloadTransferInfo to put into the packet announcing this upload. */
	QJsonObject transferInfo() const;


protected:

	QString mExpectedFingerprint;

	std::unique_ptr<QIODevice> mSource;

	QTcpServer mServer;

	quint16 mPort;

	std::shared_ptr<SslConfig> mSslConfig;

	/** The connection from the device, owned by this object (QObject child). nullptr until accepted. */
	QTcpSocket * mSocket;

	std::unique_ptr<TlsFilter> mTls;

	/** Set once all the source data has been handed to TLS. */
	bool mIsSourceExhausted;


	/** Hands more source data to TLS, if TLS and the socket have drained the previous chunk.
	Finishes the transfer once everything has been written. */
	void sendMoreData();

	// PayloadTransfer override:
	virtual void closeTransport() override;


protected slots:

	void serverNewConnection();
	void socketReadyRead();
	void socketBytesWritten();
	void socketDisconnected();
};
