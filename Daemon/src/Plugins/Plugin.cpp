#include "Plugin.hpp"





Plugin::Plugin(const QString & aName, const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger):
	mName(aName),
	mDeviceId(aDeviceId),
	mRouter(aRouter),
	mLogger(aDeviceLogger, "[" + aName + "] ")
{
}





bool Plugin::sendPacket(const Packet & aPacket)
{
	if (!mRouter.sendPacket(mDeviceId, aPacket))
	{
		mLogger.log("Cannot send packet %1, the device is not connected", aPacket.type());
		return false;
	}
	return true;
}
