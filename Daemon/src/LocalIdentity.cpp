#include "LocalIdentity.hpp"
#include <QSqlRecord>
#include <QVariant>
#include <PolarSSL-cpp/CryptoKey.h>
#include <PolarSSL-cpp/RsaPrivateKey.h>
#include <PolarSSL-cpp/SslConfig.h>
#include <PolarSSL-cpp/X509Cert.h>
#include "DB/Database.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "InstallConfiguration.hpp"
#include "MultiLogger.hpp"
#include "Utils.hpp"





/** The size of the generated RSA keys, in bits. */
static const int RSA_KEY_BITS = 2048;





LocalIdentity::LocalIdentity(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mTcpPort(0),
	mLogger(aComponents.logger("LocalIdentity"))
{
	requireForStart(ComponentCollection::ckDatabase);
	requireForStart(ComponentCollection::ckInstallConfiguration);
}





LocalIdentity::~LocalIdentity()
{
	// Needed here, where the PolarSSL-cpp classes are complete
}





void LocalIdentity::start()
{
	if (!loadKeys())
	{
		generateKeys();
	}
	mPrivateKey = std::make_shared<CryptoKey>(mPrivateKeyDer.toStdString(), std::string());
	mPublicKey = std::make_shared<CryptoKey>(mPublicKeyDer.toStdString());
	auto deviceId = mComponents.get<InstallConfiguration>()->deviceId();
	mCert = X509Cert::fromPrivateKey(mPrivateKey, mPublicKey, ("CN=" + deviceId).toStdString());
	mFingerprint = Utils::fingerprintFromDer(mPublicKeyDer);
	mLogger.log("Local identity %1 ready, certificate fingerprint %2", deviceId, mFingerprint);
}





std::shared_ptr<SslConfig> LocalIdentity::makeSslConfig(bool aIsClient)
{
	if (mCert == nullptr)
	{
		throw LogicError(mLogger, "The local identity has not been started yet");
	}
	auto config = SslConfig::makeDefaultConfig(aIsClient);
	config->setOwnCert(mCert, mPrivateKey);
	config->setAuthMode(SslAuthMode::Optional);
	return config;
}





DeviceIdentity LocalIdentity::identity()
{
	auto instConf = mComponents.get<InstallConfiguration>();
	QStringList incoming, outgoing;
	if (mComponents.has(ComponentCollection::ckPluginRegistry))
	{
		auto registry = mComponents.get<PluginRegistry>();
		incoming = registry->allIncomingCapabilities();
		outgoing = registry->allOutgoingCapabilities();
	}
	QMutexLocker lock(&mMtx);
	return DeviceIdentity(
		instConf->deviceId(),
		instConf->deviceName(),
		instConf->deviceType(),
		incoming,
		outgoing,
		mTcpPort
	);
}





void LocalIdentity::setTcpPort(quint16 aTcpPort)
{
	QMutexLocker lock(&mMtx);
	mTcpPort = aTcpPort;
}





bool LocalIdentity::loadKeys()
{
	auto conn = mComponents.get<Database>()->connection();
	auto query = conn.query("SELECT PublicKeyData, PrivateKeyData FROM LocalKeys");
	conn.exec(query);
	if (!query.first())
	{
		return false;
	}
	mPublicKeyDer = query.record().value("PublicKeyData").toByteArray();
	mPrivateKeyDer = query.record().value("PrivateKeyData").toByteArray();
	if (mPublicKeyDer.isEmpty() || mPrivateKeyDer.isEmpty())
	{
		mLogger.log("The stored key pair is incomplete, a new one will be generated");
		return false;
	}
	return true;
}





void LocalIdentity::generateKeys()
{
	mLogger.log("Generating the local key pair...");
	RsaPrivateKey rpk;
	rpk.generate(RSA_KEY_BITS);
	mPublicKeyDer  = QByteArray::fromStdString(rpk.getPubKeyDER());
	mPrivateKeyDer = QByteArray::fromStdString(rpk.getPrivKeyDER());
	mLogger.log("Local key pair generated.");

	auto conn = mComponents.get<Database>()->connection();
	auto del = conn.query("DELETE FROM LocalKeys");
	conn.exec(del);
	auto query = conn.query("INSERT INTO LocalKeys (PublicKeyData, PrivateKeyData) VALUES (?, ?)");
	query.addBindValue(mPublicKeyDer);
	query.addBindValue(mPrivateKeyDer);
	conn.exec(query);
}
