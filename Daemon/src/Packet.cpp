#include "Packet.hpp"
#include <cmath>
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>
#include "Protocol.hpp"





/** Converts the JSON number into aResult.
Returns false if the value is not a number, is not finite or doesn't fit into qint64; aResult is untouched then. */
static bool jsonToInt64(const QJsonValue & aValue, qint64 & aResult)
{
	if (!aValue.isDouble())
	{
		return false;
	}
	auto d = aValue.toDouble();

	// The qint64 range is [-2^63, 2^63), both bounds are exact doubles:
	static const double LIMIT = 9223372036854775808.0;
	if (!std::isfinite(d) || (d < -LIMIT) || (d >= LIMIT))
	{
		return false;
	}
	aResult = static_cast<qint64>(d);
	return true;
}





Packet::Packet():
	mId(0),
	mPayloadSize(0)
{
}





Packet::Packet(const QString & aType, const QJsonObject & aBody):
	mType(aType),
	mId(QDateTime::currentMSecsSinceEpoch()),
	mBody(aBody),
	mPayloadSize(0)
{
}





Packet::Packet(const QString & aType, const QJsonObject & aBody, qint64 aId):
	mType(aType),
	mId(aId),
	mBody(aBody),
	mPayloadSize(0)
{
}





bool Packet::hasPayload() const
{
	return (mPayloadSize != 0) || !mPayloadTransferInfo.isEmpty();
}





quint16 Packet::payloadPort() const
{
	qint64 port = 0;
	if (!jsonToInt64(mPayloadTransferInfo.value("port"), port) || (port <= 0) || (port > 65535))
	{
		return 0;
	}
	return static_cast<quint16>(port);
}





Packet Packet::withPayload(qint64 aSize, const QJsonObject & aTransferInfo) const
{
	Packet res(*this);
	res.mPayloadSize = aSize;
	res.mPayloadTransferInfo = aTransferInfo;
	return res;
}





QString Packet::bodyString(const QString & aKey, const QString & aDefault) const
{
	auto v = mBody.value(aKey);
	return v.isString() ? v.toString() : aDefault;
}





bool Packet::bodyBool(const QString & aKey, bool aDefault) const
{
	auto v = mBody.value(aKey);
	return v.isBool() ? v.toBool() : aDefault;
}





qint64 Packet::bodyInt(const QString & aKey, qint64 aDefault) const
{
	qint64 res = aDefault;
	if (!jsonToInt64(mBody.value(aKey), res))
	{
		return aDefault;
	}
	return res;
}





double Packet::bodyDouble(const QString & aKey, double aDefault) const
{
	auto v = mBody.value(aKey);
	return v.isDouble() ? v.toDouble() : aDefault;
}





QByteArray Packet::serialize() const
{
	QJsonObject obj(mExtraFields);
	obj.insert("id", static_cast<double>(mId));
	obj.insert("type", mType);
	obj.insert("body", mBody);
	if (hasPayload())
	{
		obj.insert("payloadSize", static_cast<double>(mPayloadSize));
		obj.insert("payloadTransferInfo", mPayloadTransferInfo);
	}
	auto res = QJsonDocument(obj).toJson(QJsonDocument::Compact);
	res.append('\n');
	return res;
}





Packet Packet::parse(const QByteArray & aLine)
{
	if (aLine.size() > Protocol::MAX_PACKET_SIZE)
	{
		throw MalformedPacketError("Packet too large: %1 bytes", aLine.size());
	}
	QJsonParseError err;
	auto doc = QJsonDocument::fromJson(aLine, &err);
	if (err.error != QJsonParseError::NoError)
	{
		throw MalformedPacketError("Invalid JSON at offset %1: %2", err.offset, err.errorString());
	}
	if (!doc.isObject())
	{
		throw MalformedPacketError("The packet is not a JSON object");
	}
	auto obj = doc.object();

	Packet res;
	auto type = obj.take("type");
	if (!type.isString() || type.toString().isEmpty())
	{
		throw MalformedPacketError("The packet has no type");
	}
	res.mType = type.toString();

	// Some implementations send the ID as a string:
	auto id = obj.take("id");
	if (id.isDouble())
	{
		if (!jsonToInt64(id, res.mId))
		{
			throw MalformedPacketError("The packet ID is out of range: %1", id.toDouble());
		}
	}
	else if (id.isString())
	{
		bool isOK = false;
		res.mId = id.toString().toLongLong(&isOK);
		if (!isOK)
		{
			throw MalformedPacketError("The packet ID is not a number: %1", id.toString());
		}
	}
	else if (!id.isUndefined())
	{
		throw MalformedPacketError("The packet ID has an invalid type");
	}

	auto body = obj.take("body");
	if (body.isObject())
	{
		res.mBody = body.toObject();
	}
	else if (!body.isUndefined() && !body.isNull())
	{
		throw MalformedPacketError("The packet body is not an object");
	}

	auto payloadSize = obj.take("payloadSize");
	if (payloadSize.isDouble())
	{
		if (!jsonToInt64(payloadSize, res.mPayloadSize) || (res.mPayloadSize < -1))
		{
			throw MalformedPacketError("The payload size is out of range: %1", payloadSize.toDouble());
		}
	}
	auto transferInfo = obj.take("payloadTransferInfo");
	if (transferInfo.isObject())
	{
		res.mPayloadTransferInfo = transferInfo.toObject();
	}

	res.mExtraFields = obj;
	return res;
}





bool Packet::extractLine(QByteArray & aBuffer, QByteArray & aLine)
{
	while (true)
	{
		auto idx = aBuffer.indexOf('\n');
		if (idx < 0)
		{
			return false;
		}
		aLine = aBuffer.left(idx);
		aBuffer.remove(0, idx + 1);
		if (aLine.endsWith('\r'))
		{
			aLine.chop(1);
		}
		if (!aLine.trimmed().isEmpty())
		{
			return true;
		}
	}
}





bool Packet::operator == (const Packet & aOther) const
{
	return (
		(mType == aOther.mType) &&
		(mId == aOther.mId) &&
		(mBody == aOther.mBody) &&
		(mPayloadSize == aOther.mPayloadSize) &&
		(mPayloadTransferInfo == aOther.mPayloadTransferInfo) &&
		(mExtraFields == aOther.mExtraFields)
	);
}
