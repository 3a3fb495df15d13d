#include "DbTrustStore.hpp"
#include <QSqlRecord>
#include <QVariant>
#include "../MultiLogger.hpp"
#include "Database.hpp"





/** Reads the entry from the current record of the query. */
static TrustStore::Entry entryFromRecord(const QSqlRecord & aRecord)
{
	TrustStore::Entry res;
	res.mDeviceId     = aRecord.value("DeviceID").toString();
	res.mFriendlyName = aRecord.value("FriendlyName").toString();
	res.mFingerprint  = aRecord.value("CertificateFingerprint").toString();
	res.mPairedAt     = QDateTime::fromMSecsSinceEpoch(aRecord.value("PairedAt").toLongLong());
	return res;
}





DbTrustStore::DbTrustStore(ComponentCollection & aComponents):
	Super(aComponents),
	mLogger(aComponents.logger("TrustStore"))
{
	requireForStart(ComponentCollection::ckDatabase);
}





Optional<TrustStore::Entry> DbTrustStore::lookup(const QString & aDeviceId)
{
	auto conn = mComponents.get<Database>()->connection();
	auto query = conn.query("SELECT * FROM TrustedDevices WHERE DeviceID = ?");
	query.addBindValue(aDeviceId);
	conn.exec(query);
	if (!query.first())
	{
		return Optional<Entry>();
	}
	return entryFromRecord(query.record());
}





void DbTrustStore::store(const Entry & aEntry)
{
	mLogger.log("Storing trust for device %1 (%2), fingerprint %3", aEntry.mDeviceId, aEntry.mFriendlyName, aEntry.mFingerprint);
	auto conn = mComponents.get<Database>()->connection();
	auto query = conn.query(
		"INSERT OR REPLACE INTO TrustedDevices (DeviceID, FriendlyName, CertificateFingerprint, PairedAt) "
		"VALUES (?, ?, ?, ?)"
	);
	query.addBindValue(aEntry.mDeviceId);
	query.addBindValue(aEntry.mFriendlyName);
	query.addBindValue(aEntry.mFingerprint);
	query.addBindValue(aEntry.mPairedAt.toMSecsSinceEpoch());
	conn.exec(query);
}





void DbTrustStore::remove(const QString & aDeviceId)
{
	mLogger.log("Removing trust for device %1", aDeviceId);
	auto conn = mComponents.get<Database>()->connection();
	auto query = conn.query("DELETE FROM TrustedDevices WHERE DeviceID = ?");
	query.addBindValue(aDeviceId);
	conn.exec(query);
}





std::vector<TrustStore::Entry> DbTrustStore::entries()
{
	std::vector<Entry> res;
	auto conn = mComponents.get<Database>()->connection();
	auto query = conn.query("SELECT * FROM TrustedDevices ORDER BY DeviceID");
	conn.exec(query);
	while (query.next())
	{
		res.push_back(entryFromRecord(query.record()));
	}
	return res;
}
