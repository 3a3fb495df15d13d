#include "SharePlugin.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include "../Payload/PayloadTransfer.hpp"





const QString SharePlugin::PACKET_TYPE = "kdeconnect.share.request";





SharePlugin::SharePlugin(
	const QString & aDeviceId,
	PacketRouter & aRouter,
	Logger & aDeviceLogger,
	const QString & aDownloadsFolder
):
	Super("share", aDeviceId, aRouter, aDeviceLogger),
	mDownloadsFolder(aDownloadsFolder)
{
}





PluginFactoryPtr SharePlugin::factory(const QString & aDownloadsFolder)
{
	return std::make_shared<PluginFactory>(
		"share",
		QStringList{PACKET_TYPE},
		QStringList{PACKET_TYPE},
		[aDownloadsFolder](const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)
		{
			return std::make_shared<SharePlugin>(aDeviceId, aRouter, aDeviceLogger, aDownloadsFolder);
		}
	);
}





bool SharePlugin::shareText(const QString & aText)
{
	QJsonObject body;
	body.insert("text", aText);
	return sendPacket(Packet(PACKET_TYPE, body));
}





bool SharePlugin::shareUrl(const QString & aUrl)
{
	QJsonObject body;
	body.insert("url", aUrl);
	return sendPacket(Packet(PACKET_TYPE, body));
}





std::shared_ptr<PayloadTransfer> SharePlugin::shareFile(const QString & aFileName)
{
	auto file = std::make_unique<QFile>(aFileName);
	if (!file->open(QIODevice::ReadOnly))
	{
		mLogger.log("Cannot share file %1: %2", aFileName, file->errorString());
		return nullptr;
	}
	auto size = file->size();
	QJsonObject body;
	body.insert("filename", QFileInfo(aFileName).fileName());
	mLogger.log("Sharing file %1 (%2 bytes)", aFileName, size);
	auto transfer = mRouter.sendPacketWithPayload(mDeviceId, Packet(PACKET_TYPE, body), std::move(file), size);
	if (transfer == nullptr)
	{
		mLogger.log("Failed to start sharing file %1", aFileName);
	}
	return transfer;
}





QString SharePlugin::uniqueFileName(const QString & aFolder, const QString & aRequestedName)
{
	auto name = QFileInfo(aRequestedName).fileName();
	if (name.isEmpty() || (name == ".") || (name == ".."))
	{
		name = "received";
	}
	QDir dir(aFolder);
	auto res = dir.filePath(name);
	if (!QFile::exists(res))
	{
		return res;
	}
	QFileInfo fi(name);
	auto base = fi.completeBaseName();
	auto suffix = fi.suffix();
	for (int i = 1;; ++i)
	{
		auto candidate = suffix.isEmpty() ?
			QString("%1 (%2)").arg(base).arg(i) :
			QString("%1 (%2).%3").arg(base).arg(i).arg(suffix);
		res = dir.filePath(candidate);
		if (!QFile::exists(res))
		{
			return res;
		}
	}
}





void SharePlugin::handlePacket(const Packet & aPacket)
{
	if (aPacket.bodyContains("filename"))
	{
		receiveFile(aPacket);
		return;
	}
	if (aPacket.bodyContains("text"))
	{
		auto text = aPacket.bodyString("text");
		mLogger.log("Received text (%1 characters)", text.size());
		emit textReceived(mDeviceId, text);
		return;
	}
	if (aPacket.bodyContains("url"))
	{
		auto url = aPacket.bodyString("url");
		mLogger.log("Received URL %1", url);
		emit urlReceived(mDeviceId, url);
		return;
	}
	throw PluginError("Share packet without any of filename, text or url");
}





void SharePlugin::receiveFile(const Packet & aPacket)
{
	if (!aPacket.hasPayload())
	{
		throw PluginError("Shared file %1 comes without a payload", aPacket.bodyString("filename"));
	}
	QDir().mkpath(mDownloadsFolder);
	auto fileName = uniqueFileName(mDownloadsFolder, aPacket.bodyString("filename"));
	auto file = std::make_unique<QFile>(fileName);
	if (!file->open(QIODevice::WriteOnly))
	{
		throw PluginError("Cannot create file %1: %2", fileName, file->errorString());
	}
	mLogger.log("Receiving file %1 (%2 bytes)", fileName, aPacket.payloadSize());
	auto transfer = mRouter.receivePayload(mDeviceId, aPacket, std::move(file));
	if (transfer == nullptr)
	{
		QFile::remove(fileName);
		throw PluginError("Cannot receive file %1, the payload transfer couldn't start", fileName);
	}
	connect(transfer.get(), &PayloadTransfer::finished, this,
		[this, fileName](PayloadTransfer * aTransfer)
		{
			Q_UNUSED(aTransfer);
			mLogger.log("File %1 received", fileName);
			emit fileReceived(mDeviceId, fileName);
		}
	);
	connect(transfer.get(), &PayloadTransfer::failed, this,
		[this, fileName](PayloadTransfer * aTransfer, const QString & aErrorMessage)
		{
			Q_UNUSED(aTransfer);
			mLogger.log("Receiving file %1 has failed: %2", fileName, aErrorMessage);
			QFile::remove(fileName);
		}
	);
}
