#include "InstallConfiguration.hpp"
#include <QDir>
#include <QStandardPaths>
#include <QSysInfo>
#include <QUuid>
#include "Settings.hpp"





InstallConfiguration::InstallConfiguration(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mDeviceType(DeviceIdentity::dtDesktop),
	mDiscoveryIntervalSec(5),
	mLivenessTimeoutSec(30),
	mPairingTimeoutSec(30),
	mMaxReconnectBackoffSec(120)
{
}





QString InstallConfiguration::dataLocation(const QString & aFileName)
{
	auto folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	QDir().mkpath(folder);
	return folder + "/" + aFileName;
}





void InstallConfiguration::loadFromSettings()
{
	mDeviceId = Settings::loadValue("Identity", "DeviceId").toString();
	if (mDeviceId.isEmpty())
	{
		mDeviceId = generateDeviceId();
		Settings::saveValue("Identity", "DeviceId", mDeviceId);
	}
	mDeviceName = Settings::loadValue("Identity", "DeviceName", QSysInfo::machineHostName()).toString();
	if (mDeviceName.isEmpty())
	{
		mDeviceName = "Konduit";
	}
	mDeviceType = DeviceIdentity::deviceTypeFromString(
		Settings::loadValue("Identity", "DeviceType", "desktop").toString()
	);

	mLogsFolder      = Settings::loadValue("Paths", "LogsFolder",      dataLocation("logs")).toString();
	mDBFileName      = Settings::loadValue("Paths", "DBFileName",      dataLocation("konduit.sqlite")).toString();
	mDownloadsFolder = Settings::loadValue("Paths", "DownloadsFolder",
		QStandardPaths::writableLocation(QStandardPaths::DownloadLocation)
	).toString();

	mDiscoveryIntervalSec   = std::max(1, Settings::loadValue("Protocol", "DiscoveryIntervalSec",   mDiscoveryIntervalSec).toInt());
	mLivenessTimeoutSec     = std::max(1, Settings::loadValue("Protocol", "LivenessTimeoutSec",     mLivenessTimeoutSec).toInt());
	mPairingTimeoutSec      = std::max(1, Settings::loadValue("Protocol", "PairingTimeoutSec",      mPairingTimeoutSec).toInt());
	mMaxReconnectBackoffSec = std::max(2, Settings::loadValue("Protocol", "MaxReconnectBackoffSec", mMaxReconnectBackoffSec).toInt());
}





QString InstallConfiguration::generateDeviceId()
{
	// KDE Connect device IDs are UUIDs with underscores instead of dashes, and no braces:
	auto res = QUuid::createUuid().toString();
	res.remove('{').remove('}');
	res.replace('-', '_');
	return res;
}
