#include <gtest/gtest.h>
#include <QString>
#include "Optional.hpp"





TEST(OptionalTest, EmptyThrowsOnAccess)
{
	Optional<QString> opt;
	EXPECT_FALSE(opt.isPresent());
	EXPECT_THROW(opt.value(), LogicError);
	const auto & constOpt = opt;
	EXPECT_THROW(constOpt.value(), LogicError);
}





TEST(OptionalTest, AssignedValueIsPresent)
{
	Optional<QString> opt;
	opt = QString("abc");
	ASSERT_TRUE(opt.isPresent());
	EXPECT_EQ(opt.value(), "abc");

	// The value is mutable in place:
	opt.value().append("d");
	EXPECT_EQ(opt.value(), "abcd");

	// Copies are independent:
	auto copy = opt;
	copy.value() = "x";
	EXPECT_EQ(opt.value(), "abcd");

	opt = Optional<QString>();
	EXPECT_FALSE(opt.isPresent());
}
