#include "MultiLogger.hpp"

#include <QDir>





/** Characters that may not appear in the log file names, besides the control characters. */
static const QString ILLEGAL_FILENAME_CHARS("/\\\"\':;&%*?|<>");

/** The longest logger name used for the file name; device IDs come from the network and may be arbitrarily long. */
static const int MAX_FILENAME_BASE_LENGTH = 100;





MultiLogger::MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder):
	ComponentSuper(aComponents),
	mLogsFolder(aLogsFolder)
{
	QDir().mkpath(aLogsFolder);
	connect(&mFlushTimer, &QTimer::timeout, this, &MultiLogger::flushAllLogs);
}





void MultiLogger::start()
{
	mFlushTimer.start(1000);
}





Logger & MultiLogger::logger(const QString & aLoggerName)
{
	auto fileName = loggerFileName(aLoggerName);
	QMutexLocker locker(&mMtxLoggers);
	auto & res = mLoggers[fileName];
	if (res == nullptr)
	{
		res = std::make_unique<Logger>(fileName);
	}
	return *res;
}





void MultiLogger::flushAllLogs()
{
	QMutexLocker locker(&mMtxLoggers);
	for (auto & logger: mLoggers)
	{
		logger.second->flush();
	}
}





QString MultiLogger::loggerFileName(const QString & aLoggerName) const
{
	auto base = aLoggerName.left(MAX_FILENAME_BASE_LENGTH);
	for (auto & ch: base)
	{
		if ((ch.unicode() < 32) || ILLEGAL_FILENAME_CHARS.contains(ch))
		{
			ch = '_';
		}
	}
	return mLogsFolder + "/" + base + ".log";
}
