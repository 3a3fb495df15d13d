#pragma once

#include <cstddef>
#include "../Exception.hpp"





// fwd:
class QSqlDatabase;





/** The schema of the Konduit DB and the steps that bring an older DB file up to it.
Schema version N is the result of applying the first N steps; the reached version is kept in the Version table.
A DB file with a version above knownVersion() was written by a newer Konduit and must not be touched. */
class DatabaseUpgrade
{
public:

	/** Thrown when an SQL command of an upgrade step fails. */
	class SqlError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Returns the schema version stored in the DB, 0 for a new (empty) DB file. */
	static size_t storedVersion(QSqlDatabase & aDB);

	/** Returns the schema version that this build creates. */
	static size_t knownVersion();

	/** Applies all the steps between storedVersion() and knownVersion(), each in its own transaction.
	Throws an SqlError if a step fails; the steps applied before it are kept. */
	static void upgrade(QSqlDatabase & aDB, Logger & aLogger);
};
