#pragma once

#include <QString>
#include <QByteArray>
#include <QMutex>
#include <QFile>
#include "StringFormatter.hpp"





/** A logger that writes its output to a single file.
The log-writing can be called simultaneously from multiple threads.
The MultiLogger component manages the instances of this class, one per subsystem / device / connection.
The file is flushed after every FLUSH_AFTER_N_MESSAGES messages, after every hex dump, and whenever
MultiLogger's periodic flush runs. */
class Logger
{
	friend class PrefixLogger;  // Needs access to logInternal() and logHexInternal()


public:

	/** Creates an instance that appends to the specified file.
	Throws a std::runtime_error if the file cannot be opened. */
	explicit Logger(const QString & aFileName);

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		logInternal(StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Logs the formatted label, followed by a hex dump of the data. */
	template <typename... T>
	void logHex(const QByteArray & aData, const QString & aFormatString, const T &... aArgs)
	{
		logHexInternal(aData, StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Flushes the log file.
	Thread-safe also in regard to all the logging functions. */
	void flush();

	/** Returns the name of the file into which this logger writes. */
	QString fileName() const { return mLogFile.fileName(); }


protected:

	/** After writing this many messages, the log file is flushed. */
	static const int FLUSH_AFTER_N_MESSAGES = 4;


	/** The file where the log data is actually written.
	Protected against multithreaded access by mMtxLogFile. */
	QFile mLogFile;

	/** The mutex protecting mLogFile from multithreaded access. */
	QMutex mMtxLogFile;

	/** Number of log messages to be yet written until a flush is forced on the log file.
	Protected against multithreaded access by mMtxLogFile. */
	int mNumMessagesUntilFlush;


	/** Returns the current timestamp as a string, to be prepended to each log line. */
	static QString currentTimestamp();

	/** Writes the specified log data into the output file, pre-pending it with the current timestamp. */
	void logInternal(const QByteArray & aLogData);

	/** Writes the specified log data along with a formatted hex dump into the output file,
	pre-pending it with the current timestamp. */
	void logHexInternal(const QByteArray & aHexData, const QByteArray & aLogData);

	/** Writes the timestamped line into mLogFile.
	Assumes mMtxLogFile is already locked by the caller. */
	void writeLine(const QByteArray & aLogData);
};





/** Relays log messages to a Logger, but every message is prefixed with a constant string, given to the constructor.
Used when multiple objects share a Logger, such as all the plugins of a single device. */
class PrefixLogger
{
public:

	/** Creates a new instance that binds to the specified Logger instance and uses the specified prefix. */
	PrefixLogger(Logger & aLogger, const QString & aPrefix):
		mLogger(aLogger),
		mPrefix(aPrefix.toUtf8())
	{
	}

	/** Writes a formatted string to the log, prefixed. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		mLogger.logInternal(mPrefix + StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Logs the formatted label, prefixed, followed by a hex dump of the data. */
	template <typename... T>
	void logHex(const QByteArray & aData, const QString & aFormatString, const T &... aArgs)
	{
		mLogger.logHexInternal(aData, mPrefix + StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Returns the underlying logger. */
	Logger & logger() { return mLogger; }


protected:

	/** The Logger where the messages are output. */
	Logger & mLogger;

	/** The prefix to use for log messages. */
	const QByteArray mPrefix;
};
