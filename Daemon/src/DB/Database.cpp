#include "Database.hpp"
#include <atomic>
#include <QSqlError>
#include <QSqlQuery>
#include "../InstallConfiguration.hpp"
#include "../MultiLogger.hpp"
#include "DatabaseUpgrade.hpp"





////////////////////////////////////////////////////////////////////////////////
// Database::DBConnection

Database::DBConnection::DBConnection(Database & aParent):
	mParent(aParent),
	mIsOwner(true)
{
	mParent.mMtxConnection.lock();
	mParent.mDatabase.transaction();
}





Database::DBConnection::DBConnection(DBConnection && aOther):
	mParent(aOther.mParent),
	mIsOwner(aOther.mIsOwner)
{
	aOther.mIsOwner = false;
}





Database::DBConnection::~DBConnection()
{
	if (!mIsOwner)
	{
		return;
	}
	if (!mParent.mDatabase.commit())
	{
		mParent.mLogger.log("DB transaction commit failed: %1", mParent.mDatabase.lastError());
	}
	mParent.mMtxConnection.unlock();
}





QSqlQuery Database::DBConnection::query(const QString & aQueryString)
{
	QSqlQuery res(mParent.mDatabase);
	if (!res.prepare(aQueryString))
	{
		throw DBQueryError(mParent.mLogger, "Failed to prepare query: %1 (query \"%2\")", res.lastError().text(), aQueryString);
	}
	return res;
}





void Database::DBConnection::exec(QSqlQuery & aQuery)
{
	if (!aQuery.exec())
	{
		throw DBQueryError(mParent.mLogger, "Failed to execute query: %1 (query \"%2\")", aQuery.lastError().text(), aQuery.lastQuery());
	}
}





////////////////////////////////////////////////////////////////////////////////
// Database:

Database::Database(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("DB"))
{
	requireForStart(ComponentCollection::ckInstallConfiguration);
}





Database::~Database()
{
	if (!mDatabase.isValid())
	{
		return;
	}
	auto connName = mDatabase.connectionName();
	mDatabase.close();
	mDatabase = QSqlDatabase();
	QSqlDatabase::removeDatabase(connName);
}





void Database::start()
{
	mLogger.log("Starting the Database component");
	open(mComponents.get<InstallConfiguration>()->dbFileName());
}





void Database::open(const QString & aDBFileName)
{
	if (mDatabase.isOpen())
	{
		throw LogicError(mLogger, "Opening another DB (%1) is not allowed", aDBFileName);
	}

	static std::atomic<int> counter(0);
	auto connName = QString::fromUtf8("DB%1").arg(counter.fetch_add(1));
	mDatabase = QSqlDatabase::addDatabase("QSQLITE", connName);
	mDatabase.setDatabaseName(aDBFileName);
	if (!mDatabase.open())
	{
		throw RuntimeError(mLogger, "Cannot open the DB file %1: %2", aDBFileName, mDatabase.lastError());
	}
	mLogger.log("Opened DB file %1", aDBFileName);

	// Refuse DBs from newer versions:
	auto version = DatabaseUpgrade::storedVersion(mDatabase);
	if (version > DatabaseUpgrade::knownVersion())
	{
		throw RuntimeError(mLogger, "Cannot open DB, it is from a newer version %1, this program can only handle up to version %2",
			version, DatabaseUpgrade::knownVersion()
		);
	}

	// Turn on foreign keys:
	auto query = mDatabase.exec("PRAGMA foreign_keys = on");
	if (query.lastError().type() != QSqlError::NoError)
	{
		throw RuntimeError(mLogger, "Failed to turn on foreign keys: %1", query.lastError());
	}

	// Upgrade the DB to the latest version:
	DatabaseUpgrade::upgrade(mDatabase, mLogger);
}





Database::DBConnection Database::connection()
{
	if (!mDatabase.isOpen())
	{
		throw LogicError(mLogger, "The DB is not open");
	}
	return Database::DBConnection(*this);
}
