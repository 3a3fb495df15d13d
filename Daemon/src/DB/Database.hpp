#pragma once

#include <QObject>
#include <QSqlDatabase>
#include <QMutex>
#include <QSqlQuery>
#include "../ComponentCollection.hpp"





/** The storage for all data that is persisted across sessions: the trusted devices and the local key pair.
Clients of this class take a DBConnection and issue their own queries on the database. */
class Database:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDatabase>
{
	Q_OBJECT
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDatabase>;


public:

	/** An exception that is thrown when DB query fails. */
	class DBQueryError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Wrapper for the DB connection, used by the clients to query and modify data.
	Only one connection is ever active at a time, to prevent threading issues.
	A DB transaction is started at the creation of the class, and committed at destruction.
	Get an instance through Database::connection(), and destroy the object as soon as the DB is not needed. */
	class DBConnection
	{
		friend class ::Database;

		/** Creates a new instance and locks aParent's mMtxConnection. */
		explicit DBConnection(Database & aParent);


	public:

		/** Takes over the lock and the transaction from aOther. */
		DBConnection(DBConnection && aOther);

		DBConnection(const DBConnection &) = delete;
		DBConnection & operator = (const DBConnection &) = delete;

		/** Commits the transaction and unlocks mParent's mMtxConnection. */
		~DBConnection();

		/** Creates a new query and prepares it using the specified query string.
		Throws a DBQueryError if query preparation fails. */
		QSqlQuery query(const QString & aQueryString);

		/** Executes the prepared query.
		Throws a DBQueryError if it fails. */
		void exec(QSqlQuery & aQuery);


	protected:

		/** The Database object that provided this connection. */
		Database & mParent;

		/** False once the ownership has been moved to another instance. */
		bool mIsOwner;
	};


	explicit Database(ComponentCollection & aComponents);

	virtual ~Database() override;

	// ComponentCollection::ComponentBase override:
	/** Opens the DB file specified in the InstallConfiguration. */
	virtual void start() override;

	/** Opens the specified SQLite file to provide the data backstore, and upgrades it to the current version.
	Only one DB can ever be open, throws a LogicError if called again.
	Throws a RuntimeError if the file cannot be opened or upgraded. */
	void open(const QString & aDBFileName);

	/** Returns a connection to the DB that can be used to query and modify data.
	Only one connection is ever active at a time, to prevent threading issues,
	so the client needs to destroy the returned connection as soon as it's done working with the DB. */
	DBConnection connection();


protected:

	/** The DB connection. */
	QSqlDatabase mDatabase;

	/** The mutex that is used to sequentialize access to the database / DBConnection. */
	QMutex mMtxConnection;

	Logger & mLogger;
};
