#pragma once

#include <memory>
#include <QByteArray>
#include <QMutex>
#include "ComponentCollection.hpp"
#include "DeviceIdentity.hpp"





// fwd:
class CryptoKey;
class X509Cert;
class SslConfig;





/** Who we are: the device ID, name and type from the InstallConfiguration, the capabilities from the
PluginRegistry, the listening port from the TcpListener, and the RSA key pair with the self-signed certificate
used for every TLS session (the main connections and the payload transfers).
The key pair is generated on the first start and persisted in the LocalKeys table. */
class LocalIdentity:
	public ComponentCollection::Component<ComponentCollection::ckLocalIdentity>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckLocalIdentity>;


public:

	explicit LocalIdentity(ComponentCollection & aComponents);

	virtual ~LocalIdentity() override;

	// ComponentCollection::ComponentBase override:
	/** Loads the key pair from the DB, generates (and stores) a new one if there's none. */
	virtual void start() override;

	/** Returns a new TLS configuration with our own certificate, for either the client or the server role.
	The peer certificate is requested, but not required, and never checked against any CA;
	the caller is expected to set a verify callback that checks the peer against the TrustStore. */
	std::shared_ptr<SslConfig> makeSslConfig(bool aIsClient);

	/** Returns the fingerprint of our own public key (the same form as TrustStore::Entry::mFingerprint). */
	const QString & fingerprint() const { return mFingerprint; }

	/** Returns our own identity, as announced to the other devices. */
	DeviceIdentity identity();

	/** Returns the identity packet announcing our own identity. */
	Packet identityPacket() { return identity().toIdentityPacket(); }

	/** Sets the TCP port on which we accept connections. Called by TcpListener once it starts listening. */
	void setTcpPort(quint16 aTcpPort);


protected:

	/** The key pair, as stored in the DB. */
	QByteArray mPublicKeyDer;
	QByteArray mPrivateKeyDer;

	std::shared_ptr<CryptoKey> mPrivateKey;
	std::shared_ptr<CryptoKey> mPublicKey;
	std::shared_ptr<X509Cert> mCert;

	QString mFingerprint;

	/** The port where TcpListener accepts connections, 0 if not listening. */
	quint16 mTcpPort;

	/** Protects mTcpPort against multithreaded access. */
	QMutex mMtx;

	Logger & mLogger;


	/** Loads the key pair from the DB into mPublicKeyDer and mPrivateKeyDer.
	Returns false if there's no key pair stored. */
	bool loadKeys();

	/** Generates a new key pair into mPublicKeyDer and mPrivateKeyDer and stores it in the DB. */
	void generateKeys();
};
