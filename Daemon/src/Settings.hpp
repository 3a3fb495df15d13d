#pragma once

#include <memory>
#include <QString>
#include <QVariant>





// fwd:
class QSettings;





/** Provides access to the persistent configuration, stored in an INI file.
A namespace-class: all functions are static; init() must be called before any other function. */
class Settings
{
public:

	/** Opens the INI file to be used as the settings storage. */
	static void init(const QString & aIniFileName);

	/** Returns the value stored in the specified section under the specified key.
	If not present, returns aDefault. */
	static QVariant loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault = QVariant());

	/** Stores the value in the specified section under the specified key, and writes it to the disk. */
	static void saveValue(const QString & aSection, const QString & aKey, const QVariant & aValue);


protected:

	/** The storage. Set in init(). */
	static std::unique_ptr<QSettings> mSettings;
};
