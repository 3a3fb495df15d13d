#include "DebugLogger.hpp"
#include <QDebug>





/** The message handler that was installed before ours. */
static QtMessageHandler gOldHandler = nullptr;





DebugLogger::DebugLogger():
	mNextMessageIdx(0)
{
	gOldHandler = qInstallMessageHandler(messageHandler);
}





DebugLogger & DebugLogger::get()
{
	static DebugLogger inst;
	return inst;
}





std::vector<DebugLogger::Message> DebugLogger::lastMessages() const
{
	QMutexLocker lock(&mMtx);
	std::vector<Message> res;
	res.reserve(NUM_MESSAGES);
	for (size_t i = 0; i < NUM_MESSAGES; ++i)
	{
		const auto & msg = mMessages[(i + mNextMessageIdx) % NUM_MESSAGES];
		if (msg.mDateTime.isValid())
		{
			res.push_back(msg);
		}
	}
	return res;
}





void DebugLogger::messageHandler(QtMsgType aType, const QMessageLogContext & aContext, const QString & aMessage)
{
	DebugLogger::get().addMessage(aType, aContext, aMessage);
	if (gOldHandler != nullptr)
	{
		gOldHandler(aType, aContext, aMessage);
	}
}





void DebugLogger::addMessage(QtMsgType aType, const QMessageLogContext & aContext, const QString & aMessage)
{
	QMutexLocker lock(&mMtx);
	mMessages[mNextMessageIdx] = Message(aType, aContext, aMessage);
	mNextMessageIdx = (mNextMessageIdx + 1) % NUM_MESSAGES;
}
