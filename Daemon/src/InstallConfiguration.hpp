#pragma once

#include <QString>
#include "ComponentCollection.hpp"
#include "DeviceIdentity.hpp"





/** The configuration of this particular installation: where the data is stored, who we are on the network
and the protocol timing knobs.
Values come from the Settings; loadFromSettings() must be called after Settings::init(). */
class InstallConfiguration:
	public ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>;


public:

	explicit InstallConfiguration(ComponentCollection & aComponents);

	/** Returns the full path to the specified file in the data folder.
	The data folder is the app's QStandardPaths::AppDataLocation, created if needed. */
	static QString dataLocation(const QString & aFileName);

	/** Loads the configuration from the Settings.
	Generates and saves the device ID if there's none yet. */
	void loadFromSettings();

	// Simple getters:
	const QString & deviceId() const { return mDeviceId; }
	const QString & deviceName() const { return mDeviceName; }
	DeviceIdentity::DeviceType deviceType() const { return mDeviceType; }
	const QString & logsFolder() const { return mLogsFolder; }
	const QString & dbFileName() const { return mDBFileName; }
	const QString & downloadsFolder() const { return mDownloadsFolder; }
	int discoveryIntervalMsec() const { return mDiscoveryIntervalSec * 1000; }
	int livenessTimeoutMsec() const { return mLivenessTimeoutSec * 1000; }
	int pairingTimeoutMsec() const { return mPairingTimeoutSec * 1000; }
	int maxReconnectBackoffMsec() const { return mMaxReconnectBackoffSec * 1000; }


protected:

	/** The ID by which we identify ourselves to other devices. Generated on the first run. */
	QString mDeviceId;

	/** The human-readable name shown on the other devices. */
	QString mDeviceName;

	DeviceIdentity::DeviceType mDeviceType;

	QString mLogsFolder;
	QString mDBFileName;

	/** Where the files shared to us by the other devices are stored. */
	QString mDownloadsFolder;

	/** How often the identity is broadcast over UDP. */
	int mDiscoveryIntervalSec;

	/** How long a device may stay silent before it's considered lost. */
	int mLivenessTimeoutSec;

	/** How long to wait for the answer to a pairing request. */
	int mPairingTimeoutSec;

	/** The ceiling of the reconnection backoff. */
	int mMaxReconnectBackoffSec;


	/** Returns a newly generated device ID. */
	static QString generateDeviceId();
};
