#pragma once

#include <vector>
#include <QString>
#include <QDateTime>
#include <QMutex>





/** Keeps the last few messages sent through qDebug() / qWarning() / qCritical() in a ring buffer,
so that they can be dumped when something goes wrong (the daemon has no console to look at).
The messages are still passed to the previously installed Qt message handler.
A singleton, installs itself as the Qt message handler upon first use of get(). */
class DebugLogger
{
public:

	/** A single message, as received from the Qt message handler. */
	struct Message
	{
		QDateTime mDateTime;
		QtMsgType mType;
		QString mFileName;
		int mLineNum;
		QString mMessage;

		Message():
			mType(QtDebugMsg),
			mLineNum(0)
		{
		}

		Message(QtMsgType aType, const QMessageLogContext & aContext, const QString & aMessage):
			mDateTime(QDateTime::currentDateTimeUtc()),
			mType(aType),
			mFileName(QString::fromUtf8(aContext.file)),
			mLineNum(aContext.line),
			mMessage(aMessage)
		{
		}
	};


	/** Returns the singleton instance. */
	static DebugLogger & get();

	/** Returns the messages stored in the ring buffer, oldest first. */
	std::vector<Message> lastMessages() const;


protected:

	/** Number of messages kept in the ring buffer. */
	static const size_t NUM_MESSAGES = 200;


	/** The ring buffer of the messages.
	Protected against multithreaded access by mMtx. */
	Message mMessages[NUM_MESSAGES];

	/** Index into mMessages where the next message will be written.
	Protected against multithreaded access by mMtx. */
	size_t mNextMessageIdx;

	/** Protects mMessages and mNextMessageIdx against multithreaded access. */
	mutable QMutex mMtx;


	DebugLogger();

	/** The handler installed into Qt. */
	static void messageHandler(QtMsgType aType, const QMessageLogContext & aContext, const QString & aMessage);

	/** Stores the message in the ring buffer. */
	void addMessage(QtMsgType aType, const QMessageLogContext & aContext, const QString & aMessage);
};
