#pragma once

#include <memory>
#include <QObject>
#include <QTimer>
#include "../Exception.hpp"





/** A single payload transfer (upload or download) bound to one device, one declared size and one port.
Runs on its own TCP + TLS connection, separate from the device's primary connection; a failure of the transfer
never affects the primary connection.
The transfer ends exactly once, either with finished() or with failed(). */
class PayloadTransfer:
	public QObject,
	public std::enable_shared_from_this<PayloadTransfer>
{
	using Super = QObject;

	Q_OBJECT


public:

	/** Describes why a transfer has failed. Reported through failed(), never thrown across the event loop. */
	class TransferError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	enum Direction
	{
		tdUpload,
		tdDownload,
	};


	/** The time without any data after which the transfer fails. */
	static const int INACTIVITY_TIMEOUT_MSEC = 30000;


	PayloadTransfer(const QString & aDeviceId, Direction aDirection, qint64 aSize, Logger & aLogger);

	// Simple getters:
	const QString & deviceId() const { return mDeviceId; }
	Direction direction() const { return mDirection; }

	/** The declared size of the payload, -1 if unknown. */
	qint64 size() const { return mSize; }

	/** The number of bytes transferred so far. */
	qint64 numTransferred() const { return mNumTransferred; }

	/** True once the transfer has either finished or failed. */
	bool isDone() const { return mIsDone; }

	/** True if the transfer has finished successfully. */
	bool hasSucceeded() const { return mIsDone && mErrorMessage.isEmpty(); }

	/** The reason of the failure, empty if not failed. */
	const QString & errorMessage() const { return mErrorMessage; }

	/** Aborts the transfer; it fails with a "cancelled" error. Ignored if already done. */
	void cancel();


protected:

	QString mDeviceId;
	Direction mDirection;
	qint64 mSize;
	qint64 mNumTransferred;
	bool mIsDone;
	QString mErrorMessage;

	/** Fails the transfer if no data flows for INACTIVITY_TIMEOUT_MSEC. */
	QTimer mInactivityTimer;

	Logger & mLogger;


	/** Restarts the inactivity timer, to be called whenever data flows. */
	void noteActivity();

	/** Marks the transfer as successfully finished and emits finished(). Ignored if already done. */
	void setFinished();

	/** Marks the transfer as failed with the error's message and emits failed(). Ignored if already done. */
	void setFailed(const TransferError & aError);

	/** Releases the transfer's network resources. Called once, when the transfer is done. */
	virtual void closeTransport() = 0;


signals:

	/** Emitted whenever more data has been transferred. */
	void progress(PayloadTransfer * aSelf, qint64 aNumTransferred);

	/** Emitted when all the data has been transferred. */
	void finished(PayloadTransfer * aSelf);

	/** Emitted when the transfer fails. */
	void failed(PayloadTransfer * aSelf, const QString & aErrorMessage);
};

using PayloadTransferPtr = std::shared_ptr<PayloadTransfer>;
