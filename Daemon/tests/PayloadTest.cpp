#include <QBuffer>
#include <gtest/gtest.h>
#include "Payload/PayloadDownload.hpp"
#include "Payload/PayloadTransfers.hpp"
#include "TestHelpers.hpp"





class PayloadTest:
	public ComponentsTest
{
protected:

	/** The destination of the last download created by newDownload(), owned by the download. */
	QBuffer * mDestination;

	std::vector<QString> mErrors;
	int mNumFinished;


	PayloadTest():
		mDestination(nullptr),
		mNumFinished(0)
	{
	}


	/** Creates a new download of the specified size into a memory buffer, recording its outcome. */
	std::shared_ptr<PayloadDownload> newDownload(const QString & aDeviceId, qint64 aSize)
	{
		auto dest = std::make_unique<QBuffer>();
		dest->open(QIODevice::WriteOnly);
		mDestination = dest.get();
		auto res = std::make_shared<PayloadDownload>(aDeviceId, aSize, std::move(dest), logger("Payload"));
		QObject::connect(res.get(), &PayloadTransfer::finished,
			[this](PayloadTransfer * aTransfer)
			{
				Q_UNUSED(aTransfer);
				mNumFinished += 1;
			}
		);
		QObject::connect(res.get(), &PayloadTransfer::failed,
			[this](PayloadTransfer * aTransfer, const QString & aErrorMessage)
			{
				Q_UNUSED(aTransfer);
				mErrors.push_back(aErrorMessage);
			}
		);
		return res;
	}
};





TEST_F(PayloadTest, FinishesAtDeclaredSize)
{
	auto dl = newDownload("dev", 10);
	dl->feed("hello");
	EXPECT_FALSE(dl->isDone());
	EXPECT_EQ(dl->numTransferred(), 5);
	dl->feed("world");
	EXPECT_TRUE(dl->hasSucceeded());
	EXPECT_EQ(mNumFinished, 1);
	EXPECT_TRUE(mErrors.empty());
	EXPECT_EQ(mDestination->data(), QByteArray("helloworld"));

	// Closing the stream afterwards changes nothing:
	dl->streamFinished();
	EXPECT_EQ(mNumFinished, 1);
	EXPECT_TRUE(mErrors.empty());
}





TEST_F(PayloadTest, ShortStreamFails)
{
	auto primary = std::make_shared<FakeConnection>(mComponents, "primary", Connection::cdInbound);
	primary->establish(makeIdentity("dev"), "AA:BB");

	auto dl = newDownload("dev", 1024);
	dl->feed(QByteArray(512, 'x'));
	dl->streamFinished();
	EXPECT_TRUE(dl->isDone());
	EXPECT_FALSE(dl->hasSucceeded());
	ASSERT_EQ(mErrors.size(), 1u);
	EXPECT_TRUE(mErrors[0].contains("512"));
	EXPECT_TRUE(mErrors[0].contains("1024"));
	EXPECT_EQ(mNumFinished, 0);

	// The device's own connection is not affected:
	EXPECT_EQ(primary->state(), Connection::csEstablished);
	EXPECT_EQ(primary->numTerminateCalls(), 0);
}





TEST_F(PayloadTest, OverflowFails)
{
	auto dl = newDownload("dev", 4);
	dl->feed("abc");
	dl->feed("de");
	EXPECT_TRUE(dl->isDone());
	EXPECT_FALSE(dl->hasSucceeded());
	ASSERT_EQ(mErrors.size(), 1u);
	EXPECT_EQ(mDestination->data(), QByteArray("abc"));

	// Reported only once:
	dl->feed("f");
	dl->streamFinished();
	EXPECT_EQ(mErrors.size(), 1u);
}





TEST_F(PayloadTest, UnknownSizeFinishesWithStream)
{
	auto dl = newDownload("dev", -1);
	dl->feed(QByteArray(3000, 'a'));
	dl->feed(QByteArray(3000, 'b'));
	EXPECT_FALSE(dl->isDone());
	dl->streamFinished();
	EXPECT_TRUE(dl->hasSucceeded());
	EXPECT_EQ(dl->numTransferred(), 6000);
}





TEST_F(PayloadTest, CancelFails)
{
	auto dl = newDownload("dev", 100);
	dl->feed("some");
	dl->cancel();
	EXPECT_TRUE(dl->isDone());
	EXPECT_FALSE(dl->hasSucceeded());
	ASSERT_EQ(mErrors.size(), 1u);
	EXPECT_TRUE(dl->errorMessage().contains("cancelled"));
	dl->cancel();
	EXPECT_EQ(mErrors.size(), 1u);
}





TEST_F(PayloadTest, TransfersAreTrackedUntilDone)
{
	auto transfers = mComponents.addNew<PayloadTransfers>();
	auto dl1 = newDownload("dev1", 3);
	auto dl2 = newDownload("dev1", 3);
	auto dl3 = newDownload("dev2", 3);
	transfers->addTransfer(dl1);
	transfers->addTransfer(dl2);
	transfers->addTransfer(dl3);
	EXPECT_EQ(transfers->transfers().size(), 3u);
	EXPECT_EQ(transfers->transfers("dev1").size(), 2u);

	dl1->feed("123");
	EXPECT_EQ(transfers->transfers("dev1").size(), 1u);

	transfers->cancelDevice("dev1");
	EXPECT_TRUE(dl2->isDone());
	EXPECT_FALSE(dl3->isDone());
	EXPECT_TRUE(transfers->transfers("dev1").empty());
	EXPECT_EQ(transfers->transfers().size(), 1u);

	// A transfer that is already done is not tracked at all:
	transfers->addTransfer(dl1);
	EXPECT_EQ(transfers->transfers().size(), 1u);
	pumpEvents();
}
