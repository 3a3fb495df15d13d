#pragma once

#include <stdexcept>

#include <QString>

#include "Logger.hpp"





/** The base of all exceptions thrown by Konduit code.
The description is formatted from a QString::arg()-style format string, each argument is stringified by
QDebug (see StringFormatter). When given a Logger, the description is also written into that log.
Usage:
throw RuntimeError(mLogger, "Cannot bind port %1: %2", port, socket.errorString());
throw LogicError("Unknown state %1", state);
*/
class Exception:
	public std::runtime_error
{
public:

	/** Creates an exception described by the formatted message and logs the message to aLogger. */
	template <typename... ArgTypes>
	Exception(Logger & aLogger, const QString & aFormatString, const ArgTypes &... aArgs):
		std::runtime_error(formatAndLog(aLogger, aFormatString, aArgs...).toStdString())
	{
	}


	/** Creates an exception described by the formatted message. */
	template <typename... ArgTypes>
	Exception(const QString & aFormatString, const ArgTypes &... aArgs):
		std::runtime_error(StringFormatter::format(aFormatString, aArgs...).toStdString())
	{
	}


	/** Returns the description as a QString, for passing into Qt APIs and signals. */
	QString message() const
	{
		return QString::fromStdString(what());
	}


protected:

	template <typename... ArgTypes>
	static QString formatAndLog(Logger & aLogger, const QString & aFormatString, const ArgTypes &... aArgs)
	{
		auto msg = StringFormatter::format(aFormatString, aArgs...);
		aLogger.log(msg);
		return msg;
	}
};





/** An error caused by the environment or by the remote peer; the program itself is fine. */
class RuntimeError:
	public Exception
{
public:
	using Exception::Exception;
};





/** An error that indicates a bug in the program. */
class LogicError:
	public Exception
{
public:
	using Exception::Exception;
};
