#include "PairingService.hpp"
#include <QDateTime>
#include "Protocol.hpp"
#include "TrustStore.hpp"
#include "Utils.hpp"





/** How often the pending pairings are checked for timeouts. */
static const int TIMEOUT_CHECK_INTERVAL_MSEC = 1000;





PairingService::PairingService(ComponentCollection & aComponents, const QString & aLocalDeviceId, int aTimeoutMsec):
	ComponentSuper(aComponents),
	mLocalDeviceId(aLocalDeviceId),
	mTimeoutMsec(aTimeoutMsec),
	mLogger(aComponents.logger("Pairing"))
{
	requireForStart(ComponentCollection::ckTrustStore);
	connect(&mTimer, &QTimer::timeout, this,
		[this]()
		{
			checkTimeouts(QDateTime::currentMSecsSinceEpoch());
		}
	);
}





void PairingService::start()
{
	mTimer.start(TIMEOUT_CHECK_INTERVAL_MSEC);
}





void PairingService::requestPairing(const QString & aDeviceId, const QString & aFingerprint)
{
	if (pairingState(aDeviceId) == psRequestedByPeer)
	{
		// No crossing request is sent, the pending one of the peer is answered instead:
		mLogger.log("Device %1 has already requested pairing, accepting its request", aDeviceId);
		acceptPairing(aDeviceId, aFingerprint);
		return;
	}
	mLogger.log("Requesting pairing with device %1", aDeviceId);
	setPending(aDeviceId, psRequested);
	emit packetToSend(aDeviceId, makePairPacket(true, true));
}





bool PairingService::acceptPairing(const QString & aDeviceId, const QString & aFingerprint)
{
	if (pairingState(aDeviceId) != psRequestedByPeer)
	{
		mLogger.log("Cannot accept pairing with device %1, it hasn't requested any", aDeviceId);
		return false;
	}
	if (aFingerprint.isEmpty())
	{
		mLogger.log("Cannot accept pairing with device %1, its certificate is not known", aDeviceId);
		return false;
	}
	mLogger.log("Pairing with device %1 accepted locally", aDeviceId);
	setPending(aDeviceId, psNone);
	trust(aDeviceId, aFingerprint);
	emit packetToSend(aDeviceId, makePairPacket(true, false));
	emit pairingResult(aDeviceId, prAccepted);
	return true;
}





void PairingService::rejectPairing(const QString & aDeviceId)
{
	auto wasPending = (pairingState(aDeviceId) != psNone);
	mLogger.log("Rejecting pairing with device %1", aDeviceId);
	setPending(aDeviceId, psNone);
	mComponents.get<TrustStore>()->remove(aDeviceId);
	emit packetToSend(aDeviceId, makePairPacket(false, false));
	if (wasPending)
	{
		emit pairingResult(aDeviceId, prRejected);
	}
}





void PairingService::unpair(const QString & aDeviceId)
{
	mLogger.log("Unpairing device %1", aDeviceId);
	setPending(aDeviceId, psNone);
	mComponents.get<TrustStore>()->remove(aDeviceId);
	emit packetToSend(aDeviceId, makePairPacket(false, false));
	emit pairingResult(aDeviceId, prUnpaired);
}





void PairingService::handlePairPacket(const QString & aDeviceId, const QString & aFingerprint, const Packet & aPacket)
{
	if (aPacket.type() != Protocol::PACKET_TYPE_PAIR)
	{
		mLogger.log("Not a pair packet from device %1: %2", aDeviceId, aPacket.type());
		return;
	}
	auto wantsPair = aPacket.bodyBool("pair", false);
	auto isRequest = wantsPair && aPacket.bodyContains("timestamp");
	auto state = pairingState(aDeviceId);
	auto trustStore = mComponents.get<TrustStore>();

	if (!wantsPair)
	{
		switch (state)
		{
			case psRequested:
			{
				mLogger.log("Device %1 has rejected our pairing request", aDeviceId);
				setPending(aDeviceId, psNone);
				emit pairingResult(aDeviceId, prRejected);
				return;
			}
			case psRequestedByPeer:
			{
				mLogger.log("Device %1 has cancelled its pairing request", aDeviceId);
				setPending(aDeviceId, psNone);
				emit pairingResult(aDeviceId, prRejected);
				return;
			}
			case psNone:
			{
				if (trustStore->isTrusted(aDeviceId))
				{
					mLogger.log("Device %1 has unpaired", aDeviceId);
					trustStore->remove(aDeviceId);
					emit pairingResult(aDeviceId, prUnpaired);
				}
				return;
			}
		}
		return;
	}

	if (!isRequest)
	{
		// An accept:
		if (state != psRequested)
		{
			mLogger.log("Ignoring an unsolicited pairing accept from device %1", aDeviceId);
			return;
		}
		mLogger.log("Device %1 has accepted our pairing request", aDeviceId);
		setPending(aDeviceId, psNone);
		trust(aDeviceId, aFingerprint);
		emit pairingResult(aDeviceId, prAccepted);
		return;
	}

	// A request:
	switch (trustStore->verify(aDeviceId, aFingerprint))
	{
		case TrustStore::tvTrusted:
		{
			mLogger.log("Device %1 requests pairing, but is already paired; accepting automatically", aDeviceId);
			setPending(aDeviceId, psNone);
			emit packetToSend(aDeviceId, makePairPacket(true, false));
			emit pairingResult(aDeviceId, prAccepted);
			return;
		}
		case TrustStore::tvMismatch:
		{
			mLogger.log("Device %1 requests pairing with a certificate different from the paired one (%2), ignoring", aDeviceId, aFingerprint);
			return;
		}
		case TrustStore::tvUnknown:
		{
			break;
		}
	}
	if (state == psRequested)
	{
		// Both sides have requested at the same time, the smaller ID keeps the requester role:
		if (Utils::smallerDeviceId(mLocalDeviceId, aDeviceId) == mLocalDeviceId)
		{
			mLogger.log("Crossing pairing request from device %1, keeping our own request", aDeviceId);
			return;
		}
		mLogger.log("Crossing pairing request from device %1, taking it as an accept of our request", aDeviceId);
		setPending(aDeviceId, psNone);
		trust(aDeviceId, aFingerprint);
		emit packetToSend(aDeviceId, makePairPacket(true, false));
		emit pairingResult(aDeviceId, prAccepted);
		return;
	}
	mLogger.log("Device %1 requests pairing", aDeviceId);
	setPending(aDeviceId, psRequestedByPeer);
	emit pairingRequested(aDeviceId);
}





void PairingService::cancel(const QString & aDeviceId)
{
	if (pairingState(aDeviceId) == psNone)
	{
		return;
	}
	mLogger.log("Cancelling the pending pairing with device %1", aDeviceId);
	setPending(aDeviceId, psNone);
}





void PairingService::checkTimeouts(qint64 aNow)
{
	std::vector<std::pair<QString, PairingState>> timedOut;
	{
		QMutexLocker lock(&mMtx);
		for (auto itr = mPending.begin(); itr != mPending.end();)
		{
			if (itr->second.mDeadline <= aNow)
			{
				timedOut.emplace_back(itr->first, itr->second.mState);
				itr = mPending.erase(itr);
			}
			else
			{
				++itr;
			}
		}
	}
	for (const auto & to: timedOut)
	{
		mLogger.log("Pairing with device %1 has timed out", to.first);
		if (to.second == psRequested)
		{
			emit packetToSend(to.first, makePairPacket(false, false));
		}
		emit pairingResult(to.first, prTimedOut);
	}
}





bool PairingService::isPaired(const QString & aDeviceId)
{
	return mComponents.get<TrustStore>()->isTrusted(aDeviceId);
}





PairingService::PairingState PairingService::pairingState(const QString & aDeviceId) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mPending.find(aDeviceId);
	if (itr == mPending.end())
	{
		return psNone;
	}
	return itr->second.mState;
}





QString PairingService::resultToString(PairingService::PairingResult aResult)
{
	switch (aResult)
	{
		case prAccepted: return "Accepted";
		case prRejected: return "Rejected";
		case prTimedOut: return "TimedOut";
		case prUnpaired: return "Unpaired";
	}
	return QString("<invalid: %1>").arg(static_cast<int>(aResult));
}





Packet PairingService::makePairPacket(bool aPair, bool aIsRequest)
{
	QJsonObject body;
	body.insert("pair", aPair);
	if (aIsRequest)
	{
		body.insert("timestamp", static_cast<double>(QDateTime::currentMSecsSinceEpoch() / 1000));
	}
	return Packet(Protocol::PACKET_TYPE_PAIR, body);
}





void PairingService::trust(const QString & aDeviceId, const QString & aFingerprint)
{
	TrustStore::Entry entry;
	entry.mDeviceId = aDeviceId;
	entry.mFriendlyName = aDeviceId;
	entry.mFingerprint = aFingerprint;
	entry.mPairedAt = QDateTime::currentDateTimeUtc();
	auto trustStore = mComponents.get<TrustStore>();
	auto old = trustStore->lookup(aDeviceId);
	if (old.isPresent() && !old.value().mFriendlyName.isEmpty())
	{
		entry.mFriendlyName = old.value().mFriendlyName;
	}
	trustStore->store(entry);
}





void PairingService::setPending(const QString & aDeviceId, PairingService::PairingState aState)
{
	QMutexLocker lock(&mMtx);
	if (aState == psNone)
	{
		mPending.erase(aDeviceId);
		return;
	}
	Pending p;
	p.mState = aState;
	p.mDeadline = QDateTime::currentMSecsSinceEpoch() + mTimeoutMsec;
	mPending[aDeviceId] = p;
}
