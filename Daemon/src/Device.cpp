#include "Device.hpp"
#include <algorithm>





const int Device::RECONNECT_BASE_MSEC;





Device::Device(const DeviceIdentity & aIdentity):
	mIdentity(aIdentity),
	mState(dsDisconnected),
	mReconnectAttempts(0),
	mNextReconnectAt(0),
	mIsAutoReconnectEnabled(true),
	mShouldPairOnConnect(false)
{
}





bool Device::isConnected() const
{
	return (mConnection != nullptr) && (mConnection->state() == Connection::csEstablished);
}





Device::Snapshot Device::snapshot() const
{
	Snapshot res;
	res.mIdentity = mIdentity;
	res.mState = mState;
	res.mNegotiatedCapabilities = mNegotiatedCapabilities;
	if (mConnection != nullptr)
	{
		res.mCertificateFingerprint = mConnection->certificateFingerprint();
	}
	res.mIsAutoReconnectEnabled = mIsAutoReconnectEnabled;
	return res;
}





qint64 Device::backoffMsec(int aAttempt, qint64 aMaxMsec)
{
	qint64 res = RECONNECT_BASE_MSEC;
	for (int i = 1; i < aAttempt; ++i)
	{
		res *= 2;
		if (res >= aMaxMsec)
		{
			return aMaxMsec;
		}
	}
	return std::min(res, aMaxMsec);
}





QString Device::stateToString(Device::State aState)
{
	switch (aState)
	{
		case dsDisconnected: return "Disconnected";
		case dsConnecting:   return "Connecting";
		case dsConnected:    return "Connected";
		case dsPairing:      return "Pairing";
		case dsPaired:       return "Paired";
	}
	return QString("<invalid: %1>").arg(static_cast<int>(aState));
}
