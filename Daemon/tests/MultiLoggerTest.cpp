#include <QFile>
#include <QFileInfo>
#include <gtest/gtest.h>
#include "MultiLogger.hpp"
#include "TestHelpers.hpp"





using MultiLoggerTest = ComponentsTest;





TEST_F(MultiLoggerTest, SameNameGivesSameLogger)
{
	auto & first = logger("Pairing");
	auto & second = logger("Pairing");
	EXPECT_EQ(&first, &second);
	EXPECT_NE(&first, &logger("Discovery"));
	EXPECT_EQ(first.fileName(), mTempDir.path() + "/logs/Pairing.log");
}





TEST_F(MultiLoggerTest, UnsafeDeviceIdsShareSanitizedFile)
{
	auto & slash = mMultiLogger->deviceLogger("a/b");
	auto & colon = mMultiLogger->deviceLogger("a:b");
	auto & control = mMultiLogger->deviceLogger(QString("a") + QChar(7) + "b");
	EXPECT_EQ(&slash, &colon);
	EXPECT_EQ(&slash, &control);
	EXPECT_EQ(slash.fileName(), mTempDir.path() + "/logs/Device-a_b.log");
}





TEST_F(MultiLoggerTest, LongNamesAreTruncated)
{
	auto & log = logger(QString(300, 'x'));
	EXPECT_EQ(QFileInfo(log.fileName()).completeBaseName(), QString(100, 'x'));
	EXPECT_EQ(&log, &logger(QString(200, 'x')));
}





TEST_F(MultiLoggerTest, WritesIntoTheFile)
{
	auto & log = logger("main");
	log.log("Listening on port %1", 1716);
	log.flush();
	QFile f(log.fileName());
	ASSERT_TRUE(f.open(QIODevice::ReadOnly));
	EXPECT_TRUE(f.readAll().contains("Listening on port 1716"));
}
