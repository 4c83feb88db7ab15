#include "huge_number.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using MidpointRounding = huge_number::MidpointRounding;

TEST(Rounding, halfToEven)
{
	ASSERT_EQ(huge_number(2), huge_number::Round(huge_number(25, -1)));
	ASSERT_EQ(huge_number(4), huge_number::Round(huge_number(35, -1)));
	ASSERT_EQ(huge_number(-2), huge_number::Round(huge_number(-25, -1)));
	ASSERT_EQ(huge_number(3), huge_number::Round(huge_number(26, -1)));
	ASSERT_EQ(huge_number(4), huge_number::Round(huge_number(7, 2, 0)));
	ASSERT_EQ(huge_number(2), huge_number::Round(huge_number(5, 2, 0)));
}

TEST(Rounding, modes)
{
	const huge_number half(-25, -1);

	ASSERT_EQ(huge_number(-3), huge_number::Round(half, MidpointRounding::AwayFromZero));
	ASSERT_EQ(huge_number(-2), huge_number::Round(half, MidpointRounding::ToZero));
	ASSERT_EQ(huge_number(-3), huge_number::Round(half, MidpointRounding::ToNegativeInfinity));
	ASSERT_EQ(huge_number(-2), huge_number::Round(half, MidpointRounding::ToPositiveInfinity));
}

TEST(Rounding, fractionalDigits)
{
	ASSERT_EQ(huge_number(123, -2), huge_number::Round(huge_number(12345, -4), 2));
	ASSERT_EQ(huge_number(124, -2), huge_number::Round(huge_number(12355, -4), 2));
	ASSERT_EQ(huge_number(12, -2), huge_number::Round(huge_number(125, -3), 2));
	ASSERT_EQ(huge_number(13, -2), huge_number::Round(huge_number(125, -3), 2, MidpointRounding::AwayFromZero));
	ASSERT_EQ(huge_number(333, -3), huge_number::Round(huge_number(1, 3, 0), 3));
	ASSERT_EQ(huge_number(1200), huge_number::Round(huge_number(1234), -2));
}

TEST(Rounding, floorCeilingTruncate)
{
	ASSERT_EQ(huge_number(-1), huge_number::Floor(huge_number(-5, -1)));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number::Ceiling(huge_number(-5, -1)));
	ASSERT_EQ(huge_number(1), huge_number::Ceiling(huge_number(5, -1)));
	ASSERT_EQ(huge_number(-1), huge_number::Truncate(huge_number(-17, -1)));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number::Truncate(huge_number(-5, -1)));
	ASSERT_EQ(huge_number(3), huge_number::Floor(huge_number(10, 3, 0)));
	ASSERT_EQ(huge_number(4), huge_number::Ceiling(huge_number(10, 3, 0)));
}

TEST(Rounding, valuesWithoutFractionUnchanged)
{
	ASSERT_EQ(huge_number(1, 100), huge_number::Round(huge_number(1, 100)));
	ASSERT_EQ(huge_number(42), huge_number::Floor(huge_number(42)));
	ASSERT_TRUE(huge_number::Round(huge_number::NaN()).isNaN());
	ASSERT_EQ(huge_number::NegativeInfinity(), huge_number::Ceiling(huge_number::NegativeInfinity()));
}

TEST(Rounding, farBelowUnit)
{
	ASSERT_EQ(huge_number::Zero(), huge_number::Round(huge_number(1, -60)));
	ASSERT_EQ(huge_number::One(), huge_number::Ceiling(huge_number(1, -60)));
	ASSERT_EQ(huge_number(-1), huge_number::Floor(huge_number(-1, -60)));
}

TEST(Rounding, roundToInt64)
{
	ASSERT_EQ(2, huge_number::RoundToInt64(huge_number(25, -1)));
	ASSERT_EQ(3, huge_number::RoundToInt64(huge_number(25, -1), MidpointRounding::AwayFromZero));
	ASSERT_THROW(huge_number::RoundToInt64(huge_number(1, 30)), std::overflow_error);
	ASSERT_THROW(huge_number::RoundToInt64(huge_number::NaN()), std::domain_error);
}
