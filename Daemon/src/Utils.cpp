#include "Utils.hpp"
#include <QCryptographicHash>
#include <QStringList>





namespace Utils
{





QByteArray toHex(const QByteArray & aData)
{
	static const char hexChars[] = "0123456789abcdef";
	QByteArray res;
	res.reserve(aData.size() * 2);
	for (const auto ch: aData)
	{
		auto b = static_cast<quint8>(ch);
		res.push_back(hexChars[(b >> 4) & 0x0f]);
		res.push_back(hexChars[b & 0x0f]);
	}
	return res;
}





QString fingerprintFromDer(const QByteArray & aPublicKeyDer)
{
	auto hash = QCryptographicHash::hash(aPublicKeyDer, QCryptographicHash::Sha256);
	auto hex = QString::fromLatin1(toHex(hash)).toUpper();
	QStringList pairs;
	for (int i = 0; i < hex.size(); i += 2)
	{
		pairs.append(hex.mid(i, 2));
	}
	return pairs.join(':');
}





const QString & smallerDeviceId(const QString & aDeviceId1, const QString & aDeviceId2)
{
	return (QString::compare(aDeviceId1, aDeviceId2, Qt::CaseSensitive) <= 0) ? aDeviceId1 : aDeviceId2;
}





}  // namespace Utils
