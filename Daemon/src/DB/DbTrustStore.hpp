#pragma once

#include "../TrustStore.hpp"





// fwd:
class Logger;





/** The TrustStore persisted in the TrustedDevices table of the Database.
Access is serialized by the Database's DBConnection. */
class DbTrustStore:
	public TrustStore
{
	using Super = TrustStore;


public:

	explicit DbTrustStore(ComponentCollection & aComponents);

	// TrustStore overrides:
	virtual Optional<Entry> lookup(const QString & aDeviceId) override;
	virtual void store(const Entry & aEntry) override;
	virtual void remove(const QString & aDeviceId) override;
	virtual std::vector<Entry> entries() override;


protected:

	Logger & mLogger;
};
