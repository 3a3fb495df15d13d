#include "PayloadTransfer.hpp"





const int PayloadTransfer::INACTIVITY_TIMEOUT_MSEC;





PayloadTransfer::PayloadTransfer(const QString & aDeviceId, Direction aDirection, qint64 aSize, Logger & aLogger):
	mDeviceId(aDeviceId),
	mDirection(aDirection),
	mSize(aSize),
	mNumTransferred(0),
	mIsDone(false),
	mLogger(aLogger)
{
	mInactivityTimer.setSingleShot(true);
	connect(&mInactivityTimer, &QTimer::timeout, this,
		[this]()
		{
			setFailed(TransferError("No data transferred in %1 msec", INACTIVITY_TIMEOUT_MSEC));
		}
	);
}





void PayloadTransfer::cancel()
{
	setFailed(TransferError("The transfer has been cancelled"));
}





void PayloadTransfer::noteActivity()
{
	if (!mIsDone)
	{
		mInactivityTimer.start(INACTIVITY_TIMEOUT_MSEC);
	}
}





void PayloadTransfer::setFinished()
{
	if (mIsDone)
	{
		return;
	}
	mIsDone = true;
	mInactivityTimer.stop();
	mLogger.log("Payload %1 of device %2 finished, %3 bytes",
		(mDirection == tdUpload) ? "upload" : "download", mDeviceId, mNumTransferred
	);
	closeTransport();
	emit finished(this);
}





void PayloadTransfer::setFailed(const PayloadTransfer::TransferError & aError)
{
	if (mIsDone)
	{
		return;
	}
	mIsDone = true;
	mInactivityTimer.stop();
	mErrorMessage = aError.message();
	mLogger.log("ERROR: Payload %1 of device %2 failed after %3 bytes: %4",
		(mDirection == tdUpload) ? "upload" : "download", mDeviceId, mNumTransferred, mErrorMessage
	);
	closeTransport();
	emit failed(this, mErrorMessage);
}
