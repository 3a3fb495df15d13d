#pragma once

#include "PluginFactory.hpp"





/** Exchanges texts, URLs and files with the device.
Received files are stored in the downloads folder under their (sanitized) names, made unique by a numeric
suffix; a partially received file is removed when its transfer fails. */
class SharePlugin:
	public Plugin
{
	using Super = Plugin;

	Q_OBJECT


public:

	static const QString PACKET_TYPE;


	SharePlugin(
		const QString & aDeviceId,
		PacketRouter & aRouter,
		Logger & aDeviceLogger,
		const QString & aDownloadsFolder
	);

	/** Returns the factory creating SharePlugin instances that store the files into aDownloadsFolder. */
	static PluginFactoryPtr factory(const QString & aDownloadsFolder);

	/** Sends the text to the device. */
	bool shareText(const QString & aText);

	/** Sends the URL to the device, to be opened there. */
	bool shareUrl(const QString & aUrl);

	/** Offers the file to the device, through a payload transfer.
	Returns the transfer, or nullptr if the file cannot be read or the transfer cannot be started. */
	std::shared_ptr<PayloadTransfer> shareFile(const QString & aFileName);

	/** Returns the name of a not-yet-existing file in aFolder, based on the name sent by the device.
	Any path components in aRequestedName are dropped. */
	static QString uniqueFileName(const QString & aFolder, const QString & aRequestedName);

	// Plugin override:
	virtual void handlePacket(const Packet & aPacket) override;


protected:

	QString mDownloadsFolder;


	/** Starts receiving the file announced by the packet. */
	void receiveFile(const Packet & aPacket);


signals:

	void textReceived(const QString & aDeviceId, const QString & aText);
	void urlReceived(const QString & aDeviceId, const QString & aUrl);

	/** Emitted when a file has been completely received and stored. */
	void fileReceived(const QString & aDeviceId, const QString & aFileName);
};
