#include "Logger.hpp"

#include <stdexcept>
#include <QDateTime>





Logger::Logger(const QString & aFileName):
	mLogFile(aFileName),
	mNumMessagesUntilFlush(FLUSH_AFTER_N_MESSAGES)
{
	if (!mLogFile.open(QFile::WriteOnly | QFile::Append))
	{
		throw std::runtime_error(QString("Cannot open log file %1 for appending").arg(aFileName).toStdString());
	}
	mLogFile.write(QString("\n\n%1\tLogfile opened\n").arg(currentTimestamp()).toUtf8());
}





void Logger::flush()
{
	QMutexLocker lock(&mMtxLogFile);
	mLogFile.flush();
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}





QString Logger::currentTimestamp()
{
	return QDateTime::currentDateTimeUtc().toString("yyyy-MM-dd hh:mm:ss.zzz");
}





void Logger::logInternal(const QByteArray & aLogData)
{
	QMutexLocker lock(&mMtxLogFile);
	writeLine(aLogData);
	mNumMessagesUntilFlush -= 1;
	if (mNumMessagesUntilFlush <= 0)
	{
		mLogFile.flush();
		mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
	}
}





void Logger::logHexInternal(const QByteArray & aHexData, const QByteArray & aLogData)
{
	static const char hexChar[] = "0123456789abcdef";
	const int bytesPerLine = 32;

	QMutexLocker lock(&mMtxLogFile);
	writeLine(aLogData);
	for (int idx = 0, len = aHexData.length(); idx < len; idx += bytesPerLine)
	{
		QByteArray hex("\t");
		QByteArray text;
		for (int chIdx = 0; (chIdx < bytesPerLine) && (idx + chIdx < len); ++chIdx)
		{
			auto ch = static_cast<quint8>(aHexData[idx + chIdx]);
			hex.append(hexChar[ch >> 4]);
			hex.append(hexChar[ch & 0x0f]);
			hex.append(' ');
			text.append(((ch < 32) || (ch >= 127)) ? '.' : static_cast<char>(ch));
		}
		mLogFile.write(hex.leftJustified(bytesPerLine * 3 + 1, ' '));
		mLogFile.write("\t", 1);
		mLogFile.write(text);
		mLogFile.write("\n", 1);
	}
	mLogFile.flush();
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}





void Logger::writeLine(const QByteArray & aLogData)
{
	mLogFile.write(currentTimestamp().toUtf8());
	mLogFile.write("\t", 1);
	mLogFile.write(aLogData);
	mLogFile.write("\n", 1);
}
