#include "DatabaseUpgrade.hpp"
#include <vector>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QSqlRecord>





/** A single step of the schema history. */
struct UpgradeStep
{
	/** What the step adds, for the log. */
	const char * mDescription;

	std::vector<const char *> mCommands;
};





static const std::vector<UpgradeStep> gUpgradeSteps =
{
	{
		"schema versioning",
		{
			"CREATE TABLE IF NOT EXISTS Version (Version INTEGER)",
			"INSERT INTO Version (Version) VALUES (0)",
		}
	},

	{
		"trusted devices and the local key pair",
		{
			"CREATE TABLE TrustedDevices ("
				"DeviceID               TEXT PRIMARY KEY,"
				"FriendlyName           TEXT,"
				"CertificateFingerprint TEXT,"
				"PairedAt               INTEGER"
			")",
			"CREATE TABLE LocalKeys ("
				"PublicKeyData  BLOB,"
				"PrivateKeyData BLOB"
			")",
		}
	},
};





/** Runs the SQL command, throws an SqlError mentioning aVersion if it fails. */
static void runCommand(QSqlDatabase & aDB, const QString & aCommand, size_t aVersion, Logger & aLogger)
{
	auto query = aDB.exec(aCommand);
	if (query.lastError().type() != QSqlError::NoError)
	{
		throw DatabaseUpgrade::SqlError(aLogger, "Failed to upgrade the DB to version %1: %2 (command \"%3\")",
			aVersion, query.lastError(), aCommand
		);
	}
}





size_t DatabaseUpgrade::storedVersion(QSqlDatabase & aDB)
{
	// A new DB file has no Version table at all; the query fails then:
	auto query = aDB.exec("SELECT MAX(Version) AS Version FROM Version");
	if (!query.first())
	{
		return 0;
	}
	return static_cast<size_t>(query.record().value("Version").toULongLong());
}





size_t DatabaseUpgrade::knownVersion()
{
	return gUpgradeSteps.size();
}





void DatabaseUpgrade::upgrade(QSqlDatabase & aDB, Logger & aLogger)
{
	auto stored = storedVersion(aDB);
	if (stored >= knownVersion())
	{
		return;
	}
	aLogger.log("Upgrading the DB from version %1 to version %2", stored, knownVersion());
	for (auto version = stored + 1; version <= knownVersion(); ++version)
	{
		const auto & step = gUpgradeSteps[version - 1];
		aLogger.log("DB version %1: %2", version, step.mDescription);
		runCommand(aDB, "BEGIN", version, aLogger);
		try
		{
			for (const auto cmd: step.mCommands)
			{
				runCommand(aDB, cmd, version, aLogger);
			}
			runCommand(aDB, QString("UPDATE Version SET Version = %1").arg(version), version, aLogger);
			runCommand(aDB, "COMMIT", version, aLogger);
		}
		catch (const SqlError &)
		{
			aDB.exec("ROLLBACK");
			throw;
		}
	}
}
