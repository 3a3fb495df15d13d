#pragma once

#include <QString>
#include <QStringList>
#include <QHostAddress>
#include <QMetaType>
#include "Packet.hpp"





/** The facts that a device announces about itself in its identity packet,
plus the network address where it was last seen.
A value type, copied around freely. The ID and the type never change once learned; refresh() updates the rest. */
class DeviceIdentity
{
public:

	enum DeviceType
	{
		dtUnknown,
		dtDesktop,
		dtLaptop,
		dtPhone,
		dtTablet,
	};


	DeviceIdentity();

	DeviceIdentity(
		const QString & aDeviceId,
		const QString & aName,
		DeviceType aType,
		const QStringList & aIncomingCapabilities,
		const QStringList & aOutgoingCapabilities,
		quint16 aTcpPort
	);

	/** Builds the identity from a received identity packet.
	aAddress is the address from which the packet came, aNow is the time of reception (msec since epoch).
	Throws a Packet::MalformedPacketError if the packet is not a valid identity packet. */
	static DeviceIdentity fromIdentityPacket(const Packet & aPacket, const QHostAddress & aAddress, qint64 aNow);

	/** Returns the identity packet announcing this identity. */
	Packet toIdentityPacket() const;

	/** Updates the mutable facts from a newer announcement of the same device.
	The device ID and the device type are kept. Marks the identity as reachable. */
	void refresh(const DeviceIdentity & aNewer);

	// Simple getters:
	const QString & deviceId() const { return mDeviceId; }
	const QString & name() const { return mName; }
	DeviceType type() const { return mType; }
	int protocolVersion() const { return mProtocolVersion; }
	const QStringList & incomingCapabilities() const { return mIncomingCapabilities; }
	const QStringList & outgoingCapabilities() const { return mOutgoingCapabilities; }
	quint16 tcpPort() const { return mTcpPort; }
	const QHostAddress & address() const { return mAddress; }
	qint64 lastSeen() const { return mLastSeen; }
	bool isReachable() const { return mIsReachable; }

	// Simple setters:
	void setAddress(const QHostAddress & aAddress) { mAddress = aAddress; }
	void setTcpPort(quint16 aTcpPort) { mTcpPort = aTcpPort; }
	void setLastSeen(qint64 aLastSeen) { mLastSeen = aLastSeen; }
	void setReachable(bool aIsReachable) { mIsReachable = aIsReachable; }
	void setProtocolVersion(int aProtocolVersion) { mProtocolVersion = aProtocolVersion; }

	/** Returns true if the identity can be used for connecting to the device. */
	bool isConnectable() const { return !mAddress.isNull() && (mTcpPort != 0); }

	/** Converts the wire string into the device type. Unknown strings map to dtUnknown. */
	static DeviceType deviceTypeFromString(const QString & aType);

	/** Converts the device type into its wire string. */
	static QString deviceTypeToString(DeviceType aType);


protected:

	QString mDeviceId;
	QString mName;
	DeviceType mType;
	int mProtocolVersion;

	/** Packet types that the device is able to receive. */
	QStringList mIncomingCapabilities;

	/** Packet types that the device may send. */
	QStringList mOutgoingCapabilities;

	/** The TCP port where the device accepts connections. */
	quint16 mTcpPort;

	/** The address from which the device last announced itself. */
	QHostAddress mAddress;

	/** When the device was last heard of, msec since epoch. */
	qint64 mLastSeen;

	/** False after the device hasn't re-announced itself within the liveness window. */
	bool mIsReachable;
};

Q_DECLARE_METATYPE(DeviceIdentity);
