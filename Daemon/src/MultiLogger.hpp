#pragma once

#include <map>
#include <memory>
#include <QObject>
#include <QMutex>
#include <QTimer>

#include "ComponentCollection.hpp"
#include "Logger.hpp"





/** Manages multiple loggers, by subsystem, by device and by connection.
Each logger writes into its own file in the logs folder. */
class MultiLogger:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckMultiLogger>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckMultiLogger>;

	Q_OBJECT


public:

	/** Creates the MultiLogger that stores its log files in the specified folder.
	The folder is created if it doesn't exist. */
	MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder);

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Returns the main logger. */
	Logger & mainLogger() { return logger("main"); }

	/** Returns the logger for the specified name (device / subsystem).
	If there's no such logger yet, creates one and starts its logfile.
	Names that differ only in the characters unsafe for a filename get the same logger. */
	Logger & logger(const QString & aLoggerName);

	/** Returns the logger used for everything related to the specified device. */
	Logger & deviceLogger(const QString & aDeviceId) { return logger("Device-" + aDeviceId); }

	/** Returns the folder where the log files are stored. */
	const QString & logsFolder() const { return mLogsFolder; }


protected:

	/** The folder where to store the log files. */
	QString mLogsFolder;

	/** All the loggers currently known, by their file name; names that map to the same file share the Logger.
	Protected against multithreaded access by mMtxLoggers. */
	std::map<QString, std::unique_ptr<Logger>> mLoggers;

	/** Protects mLoggers against multithreaded access. */
	QMutex mMtxLoggers;

	/** The timer that periodically flushes all the loggers. */
	QTimer mFlushTimer;


	/** Returns the name of the file to which the specified logger should write.
	The name is truncated and the characters unsafe for a filename are replaced. */
	QString loggerFileName(const QString & aLoggerName) const;


protected slots:

	/** Flushes all the logs. Called periodically by mFlushTimer. */
	void flushAllLogs();
};
