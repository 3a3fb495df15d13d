#include "PayloadTransfers.hpp"
#include <algorithm>
#include <QTimer>
#include "../DeviceMgr.hpp"
#include "../LocalIdentity.hpp"





PayloadTransfers::PayloadTransfers(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("Payload"))
{
	requireForStart(ComponentCollection::ckLocalIdentity);
	requireForStart(ComponentCollection::ckDeviceMgr);
}





PayloadTransfers::~PayloadTransfers()
{
	QMutexLocker lock(&mMtx);
	for (auto & transfer: mTransfers)
	{
		transfer->disconnect(this);
	}
	mTransfers.clear();
}





void PayloadTransfers::start()
{
	if (mComponents.has(ComponentCollection::ckDeviceMgr))
	{
		connect(mComponents.get<DeviceMgr>().get(), &DeviceMgr::connectionStateChanged,
			this, &PayloadTransfers::deviceStateChanged
		);
	}
}





std::shared_ptr<PayloadUpload> PayloadTransfers::startUpload(
	const QString & aDeviceId,
	const QString & aFingerprint,
	std::unique_ptr<QIODevice> && aSource,
	qint64 aSize
)
{
	auto upload = std::make_shared<PayloadUpload>(aDeviceId, aFingerprint, std::move(aSource), aSize, mLogger);
	upload->listen(mComponents.get<LocalIdentity>()->makeSslConfig(false));
	addTransfer(upload);
	return upload;
}





std::shared_ptr<PayloadDownload> PayloadTransfers::startDownload(
	const QString & aDeviceId,
	const QString & aFingerprint,
	const QHostAddress & aAddress,
	quint16 aPort,
	qint64 aSize,
	std::unique_ptr<QIODevice> && aDestination
)
{
	auto download = std::make_shared<PayloadDownload>(aDeviceId, aSize, std::move(aDestination), mLogger);
	addTransfer(download);
	download->connectTo(mComponents.get<LocalIdentity>()->makeSslConfig(true), aAddress, aPort, aFingerprint);
	return download;
}





void PayloadTransfers::addTransfer(PayloadTransferPtr aTransfer)
{
	if (aTransfer->isDone())
	{
		return;
	}
	connect(aTransfer.get(), &PayloadTransfer::finished, this,
		[this](PayloadTransfer * aSelf)
		{
			removeTransfer(aSelf);
		}
	);
	connect(aTransfer.get(), &PayloadTransfer::failed, this,
		[this](PayloadTransfer * aSelf, const QString & aErrorMessage)
		{
			Q_UNUSED(aErrorMessage);
			removeTransfer(aSelf);
		}
	);
	QMutexLocker lock(&mMtx);
	mTransfers.push_back(aTransfer);
}





void PayloadTransfers::cancelDevice(const QString & aDeviceId)
{
	auto toCancel = transfers(aDeviceId);
	if (toCancel.empty())
	{
		return;
	}
	mLogger.log("Cancelling %1 payload transfers of device %2", toCancel.size(), aDeviceId);
	for (auto & transfer: toCancel)
	{
		transfer->cancel();
	}
}





std::vector<PayloadTransferPtr> PayloadTransfers::transfers() const
{
	QMutexLocker lock(&mMtx);
	return mTransfers;
}





std::vector<PayloadTransferPtr> PayloadTransfers::transfers(const QString & aDeviceId) const
{
	std::vector<PayloadTransferPtr> res;
	QMutexLocker lock(&mMtx);
	for (const auto & transfer: mTransfers)
	{
		if (transfer->deviceId() == aDeviceId)
		{
			res.push_back(transfer);
		}
	}
	return res;
}





void PayloadTransfers::deviceStateChanged(const QString & aDeviceId, Device::State aNewState)
{
	if (aNewState == Device::dsDisconnected)
	{
		cancelDevice(aDeviceId);
	}
}





void PayloadTransfers::removeTransfer(PayloadTransfer * aTransfer)
{
	PayloadTransferPtr transfer;
	{
		QMutexLocker lock(&mMtx);
		auto itr = std::find_if(mTransfers.begin(), mTransfers.end(),
			[aTransfer](const PayloadTransferPtr & aItem)
			{
				return (aItem.get() == aTransfer);
			}
		);
		if (itr == mTransfers.end())
		{
			return;
		}
		transfer = *itr;
		mTransfers.erase(itr);
	}
	transfer->disconnect(this);

	// Release the last reference only after the current signal handler finishes:
	QTimer::singleShot(0, this, [transfer]() {});
}
