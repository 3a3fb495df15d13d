#pragma once

#include <QByteArray>
#include <QString>





namespace Utils
{





/** Converts the input data into hex representation (without any prefix, lowercase). */
QByteArray toHex(const QByteArray & aData);

/** Returns the fingerprint of the specified DER-encoded public key:
SHA-256 of the data, as uppercase hex byte pairs separated by colons ("AA:BB:..."). */
QString fingerprintFromDer(const QByteArray & aPublicKeyDer);

/** Returns the smaller (lexicographically) of the two device IDs.
Used for the deterministic tie-breaks between two devices. */
const QString & smallerDeviceId(const QString & aDeviceId1, const QString & aDeviceId2);





}  // namespace Utils
