#include <gtest/gtest.h>
#include "Packet.hpp"
#include "Protocol.hpp"





TEST(PacketTest, SerializesAsSingleTerminatedLine)
{
	QJsonObject body;
	body.insert("message", "hello\nworld");
	Packet packet("kdeconnect.ping", body, 1234);
	auto data = packet.serialize();
	ASSERT_TRUE(data.endsWith('\n'));
	EXPECT_EQ(data.count('\n'), 1);
	EXPECT_FALSE(data.contains("payloadSize"));

	auto parsed = Packet::parse(data);
	EXPECT_EQ(parsed.type(), "kdeconnect.ping");
	EXPECT_EQ(parsed.id(), 1234);
	EXPECT_EQ(parsed.bodyString("message"), "hello\nworld");
	EXPECT_EQ(parsed, packet);
}





TEST(PacketTest, ParsesKnownPingLine)
{
	auto packet = Packet::parse(R"({"id":1700000000000,"type":"kdeconnect.ping","body":{}})");
	EXPECT_EQ(packet.type(), "kdeconnect.ping");
	EXPECT_EQ(packet.id(), 1700000000000LL);
	EXPECT_TRUE(packet.body().isEmpty());
	EXPECT_FALSE(packet.hasPayload());
}





TEST(PacketTest, AcceptsStringIdAndMissingBody)
{
	auto packet = Packet::parse(R"({"id":"42","type":"kdeconnect.ping"})");
	EXPECT_EQ(packet.id(), 42);
	EXPECT_TRUE(packet.body().isEmpty());
}





TEST(PacketTest, RejectsMalformedInput)
{
	EXPECT_THROW(Packet::parse("not json at all"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse("[1, 2, 3]"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"body":{}})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"type":"","body":{}})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":"abc","type":"x","body":{}})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"type":"x","body":[]})"), Packet::MalformedPacketError);
}





TEST(PacketTest, KeepsPayloadInfo)
{
	QJsonObject info;
	info.insert("port", 1739);
	auto packet = Packet("kdeconnect.share.request", QJsonObject(), 1).withPayload(1024, info);
	auto parsed = Packet::parse(packet.serialize());
	EXPECT_TRUE(parsed.hasPayload());
	EXPECT_EQ(parsed.payloadSize(), 1024);
	EXPECT_EQ(parsed.payloadPort(), 1739);
}





TEST(PacketTest, InvalidPayloadPortIsZero)
{
	auto packet = Packet::parse(R"({"id":1,"type":"x","body":{},"payloadSize":10,"payloadTransferInfo":{"port":70000}})");
	EXPECT_TRUE(packet.hasPayload());
	EXPECT_EQ(packet.payloadPort(), 0);
}





TEST(PacketTest, PreservesUnknownTopLevelFields)
{
	auto packet = Packet::parse(R"({"id":1,"type":"x","body":{},"extra":"keep me"})");
	auto again = Packet::parse(packet.serialize());
	EXPECT_TRUE(again.serialize().contains("\"extra\":\"keep me\""));
	EXPECT_EQ(packet, again);
}





TEST(PacketTest, BodyAccessorsFallBackOnWrongTypes)
{
	auto packet = Packet::parse(R"({"id":1,"type":"x","body":{"s":"str","b":true,"n":12.5}})");
	EXPECT_EQ(packet.bodyString("s"), "str");
	EXPECT_EQ(packet.bodyString("n", "def"), "def");
	EXPECT_TRUE(packet.bodyBool("b"));
	EXPECT_TRUE(packet.bodyBool("s", true));
	EXPECT_EQ(packet.bodyInt("n"), 12);
	EXPECT_DOUBLE_EQ(packet.bodyDouble("n"), 12.5);
	EXPECT_EQ(packet.bodyInt("missing", 7), 7);
	EXPECT_TRUE(packet.bodyContains("b"));
	EXPECT_FALSE(packet.bodyContains("missing"));
}





TEST(PacketTest, OutOfRangeNumbersAreHandledAsData)
{
	// Numbers that don't fit into 64 bits are refused where the packet depends on them:
	EXPECT_THROW(Packet::parse(R"({"id":1e300,"type":"x"})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":-1e19,"type":"x"})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"type":"x","payloadSize":1e300})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"type":"x","payloadSize":9223372036854775808})"), Packet::MalformedPacketError);
	EXPECT_THROW(Packet::parse(R"({"id":1,"type":"x","payloadSize":-5})"), Packet::MalformedPacketError);
	EXPECT_EQ(Packet::parse(R"({"id":1,"type":"x","payloadSize":-1})").payloadSize(), -1);

	// ... and fall back to the defaults in the body and the transfer info:
	auto packet = Packet::parse(
		R"({"id":1,"type":"x","body":{"big":1e300,"small":-1e300,"edge":9.3e18},"payloadSize":5,"payloadTransferInfo":{"port":1e300}})"
	);
	EXPECT_EQ(packet.bodyInt("big", 7), 7);
	EXPECT_EQ(packet.bodyInt("small", -7), -7);
	EXPECT_EQ(packet.bodyInt("edge", 3), 3);
	EXPECT_DOUBLE_EQ(packet.bodyDouble("big"), 1e300);
	EXPECT_EQ(packet.payloadPort(), 0);
}





TEST(PacketTest, ExtractsLinesAcrossChunks)
{
	QByteArray buffer;
	QByteArray line;
	buffer.append(R"({"id":1,"type":"a","bo)");
	EXPECT_FALSE(Packet::extractLine(buffer, line));
	buffer.append("dy\":{}}\r\n\n{\"id\":2,");
	ASSERT_TRUE(Packet::extractLine(buffer, line));
	EXPECT_EQ(Packet::parse(line).type(), "a");
	EXPECT_FALSE(Packet::extractLine(buffer, line));
	EXPECT_EQ(buffer, QByteArray("{\"id\":2,"));
}





TEST(PacketTest, RefusesOversizedLine)
{
	QByteArray huge(Protocol::MAX_PACKET_SIZE + 1, 'x');
	EXPECT_THROW(Packet::parse(huge), Packet::MalformedPacketError);
}
