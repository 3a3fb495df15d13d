#pragma once

#include <string>
#include <QString>
#include <QStringList>
#include <QDebug>





/** Allow sending (an Utf-8-encoded) std::string directly to QDebug. */
inline QDebug operator << (QDebug aDebug, const std::string & aStr)
{
	return (aDebug << QString::fromStdString(aStr));
}





/** Provides functions for formatting strings in the QString::arg() manner ("%1", "%2", ...),
but the arguments are stringified using QDebug, so that any type printable by qDebug() can be used.
The placeholders are substituted in a single pass, so argument values containing "%N" are not re-expanded. */
namespace StringFormatter
{





/** Simple wrapper over QDebug that requires an output string and sets the underlying QDebug to nospace, noquote. */
class Debug:
	public QDebug
{
	using Super = QDebug;


public:

	explicit Debug(QString * aOutput):
		Super(aOutput)
	{
		nospace();
		noquote();
	}
};





/** Returns the QDebug representation of the value. */
template <typename T>
QString stringify(const T & aValue)
{
	QString res;
	Debug(&res) << aValue;
	return res;
}

inline QString stringify(const QString & aValue)
{
	return aValue;
}





/** Replaces the "%N" placeholders in aFormatString with aArgs[N - 1].
Placeholders referring to a non-existent arg are left untouched. */
inline QString substitute(const QString & aFormatString, const QStringList & aArgs)
{
	QString res;
	res.reserve(aFormatString.size());
	const auto len = aFormatString.size();
	for (int i = 0; i < len; ++i)
	{
		auto ch = aFormatString[i];
		if ((ch != '%') || (i + 1 >= len) || !aFormatString[i + 1].isDigit())
		{
			res.append(ch);
			continue;
		}
		int idx = aFormatString[i + 1].digitValue();
		int numDigits = 1;
		if ((i + 2 < len) && aFormatString[i + 2].isDigit())
		{
			idx = idx * 10 + aFormatString[i + 2].digitValue();
			numDigits = 2;
		}
		if ((idx < 1) || (idx > aArgs.size()))
		{
			res.append(aFormatString.mid(i, numDigits + 1));
		}
		else
		{
			res.append(aArgs[idx - 1]);
		}
		i += numDigits;
	}
	return res;
}





inline void collectArgs(QStringList & aDest)
{
	Q_UNUSED(aDest);
}

template <typename First, typename... Rest>
void collectArgs(QStringList & aDest, const First & aFirst, const Rest &... aRest)
{
	aDest.append(stringify(aFirst));
	collectArgs(aDest, aRest...);
}





inline QString format(const QString & aFormatString)
{
	return aFormatString;
}

/** Returns the format string with all the "%N" placeholders replaced by the stringified args. */
template <typename... ArgTypes>
QString format(const QString & aFormatString, const ArgTypes &... aArgs)
{
	QStringList args;
	collectArgs(args, aArgs...);
	return substitute(aFormatString, args);
}





}  // namespace StringFormatter
