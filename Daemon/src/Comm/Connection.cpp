#include "Connection.hpp"
#include "../MultiLogger.hpp"
#include "../Protocol.hpp"





Connection::Connection(
	ComponentCollection & aComponents,
	const QByteArray & aConnectionID,
	Direction aDirection,
	QObject * aParent
):
	Super(aParent),
	mComponents(aComponents),
	mConnectionID(aConnectionID),
	mDirection(aDirection),
	mState(csInitial),
	mNumConsecutiveMalformed(0),
	mLogger(createLogger(aComponents, aConnectionID))
{
}





QString Connection::stateToString(Connection::State aState)
{
	switch (aState)
	{
		case csInitial:      return "Initial";
		case csHandshaking:  return "Handshaking";
		case csEstablished:  return "Established";
		case csDisconnected: return "Disconnected";
	}
	return QString("<invalid: %1>").arg(static_cast<int>(aState));
}





void Connection::setState(Connection::State aNewState)
{
	if (mState == aNewState)
	{
		return;
	}
	mLogger.log("State change: %1 -> %2", stateToString(mState), stateToString(aNewState));
	mState = aNewState;
	emit stateChanged(this, aNewState);
}





void Connection::setEstablished(const DeviceIdentity & aRemoteIdentity)
{
	mRemoteIdentity = aRemoteIdentity;
	mDeviceId = aRemoteIdentity.deviceId();
	mLogger.log("Established with device %1 (%2), certificate %3",
		aRemoteIdentity.deviceId(), aRemoteIdentity.name(), mCertificateFingerprint
	);
	setState(csEstablished);
	emit established(this);
}





void Connection::processIncomingPlainData(const QByteArray & aData)
{
	mIncomingData.append(aData);
	QByteArray line;
	while ((mState != csDisconnected) && Packet::extractLine(mIncomingData, line))
	{
		Packet packet;
		try
		{
			packet = Packet::parse(line);
		}
		catch (const Packet::MalformedPacketError & exc)
		{
			mNumConsecutiveMalformed += 1;
			mLogger.logHex(line, "Dropping a malformed packet (%1 in a row): %2", mNumConsecutiveMalformed, exc.what());
			if (mNumConsecutiveMalformed >= MAX_CONSECUTIVE_MALFORMED)
			{
				mLogger.log("ERROR: Too many malformed packets, terminating the connection");
				terminate();
				return;
			}
			continue;
		}
		mNumConsecutiveMalformed = 0;
		if (mState == csEstablished)
		{
			emit packetReceived(this, packet);
		}
		else
		{
			handlePreEstablishedPacket(packet);
		}
	}

	if ((mState != csDisconnected) && (mIncomingData.size() > Protocol::MAX_PACKET_SIZE))
	{
		mLogger.log("ERROR: Incoming line too long (%1 bytes without a terminator), terminating the connection", mIncomingData.size());
		mIncomingData.clear();
		terminate();
	}
}





void Connection::handlePreEstablishedPacket(const Packet & aPacket)
{
	mLogger.log("Dropping packet of type %1 received before the connection was established", aPacket.type());
}





Logger & Connection::createLogger(ComponentCollection & aComponents, const QByteArray & aConnectionID)
{
	auto name = QString::fromUtf8(aConnectionID);
	name.replace(':', '_').replace('[', '_').replace(']', '_');
	return aComponents.logger("Connection-" + name);
}
