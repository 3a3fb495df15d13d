#pragma once

#include <memory>
#include <QMetaType>
#include <QStringList>
#include "Comm/Connection.hpp"
#include "DeviceIdentity.hpp"
#include "Plugins/PluginHost.hpp"





/** Encapsulates the data for a single device known to DeviceMgr.
Devices are owned exclusively by DeviceMgr and changed only under its lock; everyone else gets a Snapshot. */
class Device
{
	friend class DeviceMgr;


public:

	enum State
	{
		dsDisconnected,  ///< No connection, possibly waiting for a reconnect
		dsConnecting,    ///< An outbound connection is being established
		dsConnected,     ///< Connected, but not paired; only identity and pairing packets are processed
		dsPairing,       ///< Connected, a pairing request is pending (either side)
		dsPaired,        ///< Connected and trusted; the packets are dispatched to the plugins
	};


	/** A copy of the device's data, for external collaborators. */
	struct Snapshot
	{
		DeviceIdentity mIdentity;
		State mState;
		QStringList mNegotiatedCapabilities;

		/** The fingerprint of the certificate presented on the current connection, empty if not connected. */
		QString mCertificateFingerprint;

		bool mIsAutoReconnectEnabled;
	};


	/** The initial reconnect delay; each further attempt doubles it. */
	static const int RECONNECT_BASE_MSEC = 2000;


	/** Creates a disconnected device with the specified identity. */
	explicit Device(const DeviceIdentity & aIdentity);

	// Simple getters:
	const QString & deviceId() const { return mIdentity.deviceId(); }
	const DeviceIdentity & identity() const { return mIdentity; }
	State state() const { return mState; }

	/** Returns true if the device has a connection that is established. */
	bool isConnected() const;

	/** Returns a copy of the device's data. */
	Snapshot snapshot() const;

	/** Returns the delay before the reconnect attempt number aAttempt (1-based):
	RECONNECT_BASE_MSEC, doubled with each attempt, capped at aMaxMsec. */
	static qint64 backoffMsec(int aAttempt, qint64 aMaxMsec);

	/** Returns the string representation of the state, for logging. */
	static QString stateToString(State aState);


protected:

	DeviceIdentity mIdentity;

	State mState;

	/** The capabilities negotiated with the device, valid while paired. */
	QStringList mNegotiatedCapabilities;

	/** The current connection, nullptr if none. */
	ConnectionPtr mConnection;

	/** The device's plugins, present only while paired. */
	PluginHostPtr mPluginHost;

	/** The number of consecutive failed reconnect attempts. */
	int mReconnectAttempts;

	/** When to attempt the next reconnect, msec since epoch; 0 if no reconnect is scheduled. */
	qint64 mNextReconnectAt;

	/** Cleared by an explicit disconnect or an untrusted certificate, set by an explicit connect. */
	bool mIsAutoReconnectEnabled;

	/** Set when a pairing was requested while not connected; the request is sent once connected. */
	bool mShouldPairOnConnect;
};

using DevicePtr = std::shared_ptr<Device>;

Q_DECLARE_METATYPE(Device::State);
