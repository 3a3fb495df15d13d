#pragma once

#include <memory>
#include <QHostAddress>
#include <QIODevice>
#include <QTcpSocket>
#include "PayloadTransfer.hpp"





// fwd:
class SslConfig;
class TlsFilter;





/** The receiving side of a payload transfer.
Connects to the port announced by the device, runs TLS as the client and writes exactly the declared number
of bytes into the destination. More data than declared, or the connection closing early, fails the transfer. */
class PayloadDownload:
	public PayloadTransfer
{
	using Super = PayloadTransfer;

	Q_OBJECT


public:

	/** Creates a new download of aSize bytes (-1 if unknown) from the specified device into aDestination
	(already open for writing). */
	PayloadDownload(
		const QString & aDeviceId,
		qint64 aSize,
		std::unique_ptr<QIODevice> && aDestination,
		Logger & aLogger
	);

	virtual ~PayloadDownload() override;

	/** Connects to the device's payload endpoint; TLS uses aSslConfig (client role) and accepts only the peer
	presenting aExpectedFingerprint (any peer, if empty). */
	void connectTo(
		std::shared_ptr<SslConfig> aSslConfig,
		const QHostAddress & aAddress,
		quint16 aPort,
		const QString & aExpectedFingerprint
	);

	/** Processes a piece of the received (decrypted) payload data. */
	void feed(const QByteArray & aData);

	/** Processes the end of the payload stream.
	Finishes the transfer if the size was unknown, fails it if fewer bytes than declared have arrived. */
	void streamFinished();


protected:

	std::unique_ptr<QIODevice> mDestination;

	/** The connection to the device, owned by this object (QObject child). nullptr until connectTo(). */
	QTcpSocket * mSocket;

	std::unique_ptr<TlsFilter> mTls;

	std::shared_ptr<SslConfig> mSslConfig;

	QString mExpectedFingerprint;


	// PayloadTransfer override:
	virtual void closeTransport() override;


protected slots:

	void socketConnected();
	void socketReadyRead();
	void socketDisconnected();
	void socketError(QAbstractSocket::SocketError aError);
};
