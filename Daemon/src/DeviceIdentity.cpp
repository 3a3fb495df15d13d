#include "DeviceIdentity.hpp"
#include <algorithm>
#include <limits>
#include <QJsonArray>
#include "Protocol.hpp"





/** The longest device ID that we accept from the network. */
static const int MAX_DEVICE_ID_LENGTH = 128;





/** Converts a JSON array of strings into a QStringList, skipping non-string items and duplicates. */
static QStringList toStringList(const QJsonValue & aValue)
{
	QStringList res;
	for (const auto & item: aValue.toArray())
	{
		if (item.isString() && !res.contains(item.toString()))
		{
			res.append(item.toString());
		}
	}
	return res;
}





DeviceIdentity::DeviceIdentity():
	mType(dtUnknown),
	mProtocolVersion(Protocol::PROTOCOL_VERSION),
	mTcpPort(0),
	mLastSeen(0),
	mIsReachable(false)
{
}





DeviceIdentity::DeviceIdentity(
	const QString & aDeviceId,
	const QString & aName,
	DeviceType aType,
	const QStringList & aIncomingCapabilities,
	const QStringList & aOutgoingCapabilities,
	quint16 aTcpPort
):
	mDeviceId(aDeviceId),
	mName(aName),
	mType(aType),
	mProtocolVersion(Protocol::PROTOCOL_VERSION),
	mIncomingCapabilities(aIncomingCapabilities),
	mOutgoingCapabilities(aOutgoingCapabilities),
	mTcpPort(aTcpPort),
	mLastSeen(0),
	mIsReachable(true)
{
}





DeviceIdentity DeviceIdentity::fromIdentityPacket(const Packet & aPacket, const QHostAddress & aAddress, qint64 aNow)
{
	if (aPacket.type() != Protocol::PACKET_TYPE_IDENTITY)
	{
		throw Packet::MalformedPacketError("Expected an identity packet, got %1", aPacket.type());
	}
	const auto & body = aPacket.body();
	auto deviceId = aPacket.bodyString("deviceId");
	if (deviceId.isEmpty())
	{
		throw Packet::MalformedPacketError("The identity packet has no deviceId");
	}
	if (deviceId.size() > MAX_DEVICE_ID_LENGTH)
	{
		throw Packet::MalformedPacketError("The identity packet has a too long deviceId (%1 chars)", deviceId.size());
	}
	auto tcpPort = aPacket.bodyInt("tcpPort", 0);
	if ((tcpPort < 0) || (tcpPort > 65535))
	{
		throw Packet::MalformedPacketError("The identity packet has an invalid tcpPort: %1", tcpPort);
	}

	DeviceIdentity res;
	res.mDeviceId = deviceId;
	res.mName = aPacket.bodyString("deviceName").trimmed();
	if (res.mName.isEmpty())
	{
		res.mName = deviceId;
	}
	res.mType = deviceTypeFromString(aPacket.bodyString("deviceType"));
	auto protocolVersion = aPacket.bodyInt("protocolVersion", 0);
	if ((protocolVersion < 0) || (protocolVersion > std::numeric_limits<int>::max()))
	{
		throw Packet::MalformedPacketError("The identity packet has an invalid protocolVersion: %1", protocolVersion);
	}
	res.mProtocolVersion = static_cast<int>(protocolVersion);
	res.mIncomingCapabilities = toStringList(body.value("incomingCapabilities"));
	res.mOutgoingCapabilities = toStringList(body.value("outgoingCapabilities"));
	res.mTcpPort = static_cast<quint16>(tcpPort);
	res.mAddress = aAddress;
	res.mLastSeen = aNow;
	res.mIsReachable = true;
	return res;
}





Packet DeviceIdentity::toIdentityPacket() const
{
	QJsonObject body;
	body.insert("deviceId", mDeviceId);
	body.insert("deviceName", mName);
	body.insert("deviceType", deviceTypeToString(mType));
	body.insert("protocolVersion", mProtocolVersion);
	body.insert("incomingCapabilities", QJsonArray::fromStringList(mIncomingCapabilities));
	body.insert("outgoingCapabilities", QJsonArray::fromStringList(mOutgoingCapabilities));
	if (mTcpPort != 0)
	{
		body.insert("tcpPort", mTcpPort);
	}
	return Packet(Protocol::PACKET_TYPE_IDENTITY, body);
}





void DeviceIdentity::refresh(const DeviceIdentity & aNewer)
{
	mName = aNewer.mName;
	mProtocolVersion = aNewer.mProtocolVersion;
	mIncomingCapabilities = aNewer.mIncomingCapabilities;
	mOutgoingCapabilities = aNewer.mOutgoingCapabilities;
	if (aNewer.mTcpPort != 0)
	{
		mTcpPort = aNewer.mTcpPort;
	}
	if (!aNewer.mAddress.isNull())
	{
		mAddress = aNewer.mAddress;
	}
	mLastSeen = std::max(mLastSeen, aNewer.mLastSeen);
	mIsReachable = true;
}





DeviceIdentity::DeviceType DeviceIdentity::deviceTypeFromString(const QString & aType)
{
	if (aType == "desktop")
	{
		return dtDesktop;
	}
	if (aType == "laptop")
	{
		return dtLaptop;
	}
	if ((aType == "phone") || (aType == "smartphone"))
	{
		return dtPhone;
	}
	if (aType == "tablet")
	{
		return dtTablet;
	}
	return dtUnknown;
}





QString DeviceIdentity::deviceTypeToString(DeviceIdentity::DeviceType aType)
{
	switch (aType)
	{
		case dtDesktop: return "desktop";
		case dtLaptop:  return "laptop";
		case dtPhone:   return "phone";
		case dtTablet:  return "tablet";
		case dtUnknown: return "unknown";
	}
	return "unknown";
}
