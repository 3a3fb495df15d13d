#pragma once

#include <vector>
#include <QString>
#include <QDateTime>
#include "ComponentCollection.hpp"
#include "Optional.hpp"





/** The mapping from device ID to the certificate fingerprint that the device presented when it was paired.
The single source of truth for deciding whether a connection may become paired.
An abstract component, so that the persistence can be swapped (DbTrustStore in the daemon, in-memory in tests).
All functions are synchronous and may be called from any thread. */
class TrustStore:
	public ComponentCollection::Component<ComponentCollection::ckTrustStore>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckTrustStore>;


public:

	/** A single trusted device. */
	struct Entry
	{
		QString mDeviceId;
		QString mFriendlyName;

		/** The SHA-256 fingerprint of the device's public key, "AA:BB:..." */
		QString mFingerprint;

		QDateTime mPairedAt;
	};


	/** The result of checking a presented certificate against the store. */
	enum Verdict
	{
		tvTrusted,   ///< The device is paired and the fingerprint matches
		tvUnknown,   ///< The device is not paired
		tvMismatch,  ///< The device is paired, but with a different certificate
	};


	explicit TrustStore(ComponentCollection & aComponents):
		ComponentSuper(aComponents)
	{
	}

	/** Returns the entry for the specified device, or an empty Optional if the device is not trusted. */
	virtual Optional<Entry> lookup(const QString & aDeviceId) = 0;

	/** Stores the entry, replacing any previous entry for the same device. */
	virtual void store(const Entry & aEntry) = 0;

	/** Removes the entry for the specified device. Ignored if there's no such entry. */
	virtual void remove(const QString & aDeviceId) = 0;

	/** Returns all the entries. */
	virtual std::vector<Entry> entries() = 0;

	/** Checks the fingerprint presented by the device against the store. */
	Verdict verify(const QString & aDeviceId, const QString & aFingerprint)
	{
		auto entry = lookup(aDeviceId);
		if (!entry.isPresent())
		{
			return tvUnknown;
		}
		return (entry.value().mFingerprint == aFingerprint) ? tvTrusted : tvMismatch;
	}

	/** Returns true if the device has an entry in the store. */
	bool isTrusted(const QString & aDeviceId)
	{
		return lookup(aDeviceId).isPresent();
	}
};
