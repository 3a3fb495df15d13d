#pragma once

#include <memory>
#include <vector>
#include <QHostAddress>
#include <QMutex>
#include <QObject>
#include "../ComponentCollection.hpp"
#include "../Device.hpp"
#include "PayloadDownload.hpp"
#include "PayloadUpload.hpp"





/** Keeps track of all the payload transfers in progress.
Creates the uploads and downloads with our TLS credentials, holds them until they are done, and cancels all
the transfers of a device when the device disconnects. */
class PayloadTransfers:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckPayloadTransfers>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckPayloadTransfers>;

	Q_OBJECT


public:

	explicit PayloadTransfers(ComponentCollection & aComponents);

	virtual ~PayloadTransfers() override;

	// ComponentCollection::ComponentBase override:
	/** Starts watching the device states, so that the transfers of disconnected devices are cancelled. */
	virtual void start() override;

	/** Starts a new upload of aSize bytes from aSource to the specified device, which is expected to present
	aFingerprint. Returns the upload, already listening.
	Throws a PayloadTransfer::TransferError if the upload cannot listen. */
	std::shared_ptr<PayloadUpload> startUpload(
		const QString & aDeviceId,
		const QString & aFingerprint,
		std::unique_ptr<QIODevice> && aSource,
		qint64 aSize
	);

	/** Starts a new download of aSize bytes from the specified device's payload endpoint into aDestination. */
	std::shared_ptr<PayloadDownload> startDownload(
		const QString & aDeviceId,
		const QString & aFingerprint,
		const QHostAddress & aAddress,
		quint16 aPort,
		qint64 aSize,
		std::unique_ptr<QIODevice> && aDestination
	);

	/** Starts tracking the transfer until it is done. */
	void addTransfer(PayloadTransferPtr aTransfer);

	/** Cancels all the transfers of the specified device. */
	void cancelDevice(const QString & aDeviceId);

	/** Returns all the transfers in progress. */
	std::vector<PayloadTransferPtr> transfers() const;

	/** Returns the transfers in progress for the specified device. */
	std::vector<PayloadTransferPtr> transfers(const QString & aDeviceId) const;


public slots:

	/** Cancels the device's transfers when the device goes disconnected. */
	void deviceStateChanged(const QString & aDeviceId, Device::State aNewState);


protected:

	/** All the transfers in progress.
	Protected against multithreaded access by mMtx. */
	std::vector<PayloadTransferPtr> mTransfers;

	mutable QMutex mMtx;

	Logger & mLogger;


	/** Stops tracking the transfer. The transfer object is released in the next event loop iteration. */
	void removeTransfer(PayloadTransfer * aTransfer);
};
