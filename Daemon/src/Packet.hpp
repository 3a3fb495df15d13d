#pragma once

#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include "Exception.hpp"





/** A single protocol message: a type tag, a timestamp id and an open JSON body.
Optionally declares a payload that is transferred separately (see PayloadTransfer).
On the wire, a packet is a single line of compact JSON terminated by a newline:
{"id": 1700000000000, "type": "kdeconnect.ping", "body": {}, "payloadSize": 123, "payloadTransferInfo": {"port": 1739}}
Packets are immutable, a new Packet is built for every send.
Unknown top-level fields received from the peer are kept and serialized back. */
class Packet
{
public:

	/** Thrown by parse() when the data is not a valid packet. */
	class MalformedPacketError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Creates an empty packet with no type. Needed for Qt's metatype system. */
	Packet();

	/** Creates a new packet of the specified type and body, with the current time as the ID. */
	explicit Packet(const QString & aType, const QJsonObject & aBody = QJsonObject());

	/** Creates a new packet of the specified type and body, with an explicit ID. */
	Packet(const QString & aType, const QJsonObject & aBody, qint64 aId);

	// Simple getters:
	const QString & type() const { return mType; }
	qint64 id() const { return mId; }
	const QJsonObject & body() const { return mBody; }
	qint64 payloadSize() const { return mPayloadSize; }
	const QJsonObject & payloadTransferInfo() const { return mPayloadTransferInfo; }

	/** Returns true if the packet declares a payload (size or transfer info present). */
	bool hasPayload() const;

	/** Returns the port from the payload transfer info, or 0 if not present / invalid. */
	quint16 payloadPort() const;

	/** Returns a copy of this packet that declares the specified payload. */
	Packet withPayload(qint64 aSize, const QJsonObject & aTransferInfo) const;

	/** Returns the string value of the specified body field, or aDefault if not present or not a string. */
	QString bodyString(const QString & aKey, const QString & aDefault = QString()) const;

	/** Returns the bool value of the specified body field, or aDefault if not present or not a bool. */
	bool bodyBool(const QString & aKey, bool aDefault = false) const;

	/** Returns the integral value of the specified body field, or aDefault if not present or not a number. */
	qint64 bodyInt(const QString & aKey, qint64 aDefault = 0) const;

	/** Returns the floating-point value of the specified body field, or aDefault if not present or not a number. */
	double bodyDouble(const QString & aKey, double aDefault = 0) const;

	/** Returns true if the body contains the specified field. */
	bool bodyContains(const QString & aKey) const { return mBody.contains(aKey); }

	/** Returns the wire representation of the packet, including the terminating newline. */
	QByteArray serialize() const;

	/** Parses a single packet line (with or without the trailing newline).
	Throws a MalformedPacketError if the data is not a valid packet. */
	static Packet parse(const QByteArray & aLine);

	/** Extracts the first complete line from aBuffer into aLine (without the newline) and removes it from aBuffer.
	Empty lines are skipped.
	Returns false if aBuffer doesn't contain a complete line yet. */
	static bool extractLine(QByteArray & aBuffer, QByteArray & aLine);

	bool operator == (const Packet & aOther) const;
	bool operator != (const Packet & aOther) const { return !operator == (aOther); }


protected:

	/** The packet type, such as "kdeconnect.ping". Compared case-sensitively. */
	QString mType;

	/** The packet ID, a millisecond timestamp of creation on the sending side. */
	qint64 mId;

	/** The type-specific data. */
	QJsonObject mBody;

	/** The declared size of the payload, 0 if no payload.
	KDE Connect uses -1 for payloads of unknown size. */
	qint64 mPayloadSize;

	/** The info needed for connecting to the payload transfer ("port"). */
	QJsonObject mPayloadTransferInfo;

	/** Top-level fields of a received packet that we don't understand. Serialized back unchanged. */
	QJsonObject mExtraFields;
};

Q_DECLARE_METATYPE(Packet);
