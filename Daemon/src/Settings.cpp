#include "Settings.hpp"
#include <QSettings>
#include "Exception.hpp"





std::unique_ptr<QSettings> Settings::mSettings;





void Settings::init(const QString & aIniFileName)
{
	mSettings = std::make_unique<QSettings>(aIniFileName, QSettings::IniFormat);
	if (mSettings->status() != QSettings::NoError)
	{
		throw RuntimeError("Cannot read the settings file %1: status %2", aIniFileName, mSettings->status());
	}
}





QVariant Settings::loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault)
{
	if (mSettings == nullptr)
	{
		throw LogicError("Settings not initialized");
	}
	return mSettings->value(aSection + "/" + aKey, aDefault);
}





void Settings::saveValue(const QString & aSection, const QString & aKey, const QVariant & aValue)
{
	if (mSettings == nullptr)
	{
		throw LogicError("Settings not initialized");
	}
	mSettings->setValue(aSection + "/" + aKey, aValue);
	mSettings->sync();
}
