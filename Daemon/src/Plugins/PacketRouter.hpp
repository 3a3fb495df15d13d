#pragma once

#include <memory>
#include <QIODevice>
#include "../Packet.hpp"





// fwd:
class PayloadTransfer;





/** The outbound channel given to the plugins.
Plugins address the devices only by their ID; the router (DeviceMgr in the daemon) resolves the current
connection, so that a plugin never holds on to a connection or a device object. */
class PacketRouter
{
public:

	virtual ~PacketRouter() {}

	/** Sends the packet to the specified device.
	Returns false if the device is not connected (the packet is dropped). */
	virtual bool sendPacket(const QString & aDeviceId, const Packet & aPacket) = 0;

	/** Offers the data in aSource (aSize bytes) to the specified device, announcing it with aPacket.
	The router opens the payload endpoint and adds the transfer info to the packet.
	Returns the transfer, or nullptr if the device is not connected or the endpoint cannot be opened. */
	virtual std::shared_ptr<PayloadTransfer> sendPacketWithPayload(
		const QString & aDeviceId,
		const Packet & aPacket,
		std::unique_ptr<QIODevice> && aSource,
		qint64 aSize
	) = 0;

	/** Starts receiving the payload announced by aPacket from the specified device into aDestination.
	Returns the transfer, or nullptr if the packet has no usable payload info or the device is not connected. */
	virtual std::shared_ptr<PayloadTransfer> receivePayload(
		const QString & aDeviceId,
		const Packet & aPacket,
		std::unique_ptr<QIODevice> && aDestination
	) = 0;
};
