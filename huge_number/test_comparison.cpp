#include "huge_number.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(Comparison, ordersFiniteValues)
{
	ASSERT_TRUE(huge_number(1) < huge_number(2));
	ASSERT_TRUE(huge_number(-2) < huge_number(-1));
	ASSERT_TRUE(huge_number(1, 20) > huge_number(99));
	ASSERT_TRUE(huge_number(15, -1) <= huge_number(3, 2, 0));
	ASSERT_TRUE(huge_number(15, -1) >= huge_number(3, 2, 0));
	ASSERT_EQ(1, huge_number::CompareTo(huge_number(1, 3, 0), huge_number(333333333333333333, -18)));
	ASSERT_EQ(-1, huge_number::CompareTo(huge_number(-1, 3, 0), huge_number(-333333333333333333, -18)));
}

TEST(Comparison, ordersSpecialValues)
{
	ASSERT_EQ(-1, huge_number::CompareTo(huge_number::NegativeInfinity(), huge_number::MinValue()));
	ASSERT_EQ(1, huge_number::CompareTo(huge_number::PositiveInfinity(), huge_number::MaxValue()));
	ASSERT_EQ(0, huge_number::CompareTo(huge_number::PositiveInfinity(), huge_number::PositiveInfinity()));
	ASSERT_EQ(-1, huge_number::CompareTo(huge_number::NegativeZero(), huge_number::Zero()));
	ASSERT_EQ(1, huge_number::CompareTo(huge_number::Epsilon(), huge_number::Zero()));
}

TEST(Comparison, nanSortsFirst)
{
	ASSERT_EQ(-1, huge_number::CompareTo(huge_number::NaN(), huge_number::NegativeInfinity()));
	ASSERT_EQ(1, huge_number::CompareTo(huge_number(1), huge_number::NaN()));
	ASSERT_EQ(0, huge_number::CompareTo(huge_number::NaN(), huge_number::NaN()));
	ASSERT_FALSE(huge_number::NaN() == huge_number::NaN());
	ASSERT_TRUE(huge_number::NaN() != huge_number::NaN());
}

TEST(Comparison, equalityComparesFields)
{
	ASSERT_EQ(0, huge_number::CompareTo(huge_number(1, 2, 0), huge_number(5, -1)));
	ASSERT_NE(huge_number(1, 2, 0), huge_number(5, -1));
	ASSERT_NE(huge_number::Zero(), huge_number::NegativeZero());
	ASSERT_EQ(huge_number(100), huge_number(1, 2));
}

TEST(Comparison, minMaxClamp)
{
	ASSERT_EQ(huge_number(-3), huge_number::Min(huge_number(-3), huge_number(2)));
	ASSERT_EQ(huge_number(2), huge_number::Max(huge_number(-3), huge_number(2)));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number::Min(huge_number::NegativeZero(), huge_number::Zero()));
	ASSERT_TRUE(huge_number::Max(huge_number::NaN(), huge_number(1)).isNaN());

	ASSERT_EQ(huge_number(10), huge_number::Clamp(huge_number(15), huge_number(0), huge_number(10)));
	ASSERT_EQ(huge_number(0), huge_number::Clamp(huge_number(-15), huge_number(0), huge_number(10)));
	ASSERT_EQ(huge_number(5), huge_number::Clamp(huge_number(5), huge_number(0), huge_number(10)));
	ASSERT_TRUE(huge_number::Clamp(huge_number(5), huge_number(10), huge_number(0)).isNaN());
}

TEST(Comparison, magnitude)
{
	ASSERT_EQ(huge_number(-3), huge_number::MaxMagnitude(huge_number(-3), huge_number(2)));
	ASSERT_EQ(huge_number(2), huge_number::MinMagnitude(huge_number(-3), huge_number(2)));

	ASSERT_EQ(huge_number(3), huge_number::MaxMagnitude(huge_number(3), huge_number(-3)));
	ASSERT_EQ(huge_number(3), huge_number::MaxMagnitude(huge_number(-3), huge_number(3)));
	ASSERT_EQ(huge_number(-3), huge_number::MinMagnitude(huge_number(3), huge_number(-3)));
	ASSERT_EQ(huge_number(-3), huge_number::MinMagnitude(huge_number(-3), huge_number(3)));
	ASSERT_EQ(huge_number::Zero(), huge_number::MaxMagnitude(huge_number::NegativeZero(), huge_number::Zero()));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number::MinMagnitude(huge_number::Zero(), huge_number::NegativeZero()));
	ASSERT_EQ(huge_number::NegativeInfinity(), huge_number::MaxMagnitude(huge_number::NegativeInfinity(), huge_number::MaxValue()));

	ASSERT_TRUE(huge_number::MaxMagnitude(huge_number::NaN(), huge_number(1)).isNaN());
	ASSERT_TRUE(huge_number::MinMagnitude(huge_number(1), huge_number::NaN()).isNaN());
	ASSERT_EQ(huge_number(-4), huge_number::MaxMagnitudeNumber(huge_number::NaN(), huge_number(-4)));
	ASSERT_EQ(huge_number(-4), huge_number::MinMagnitudeNumber(huge_number(-4), huge_number::NaN()));
	ASSERT_TRUE(huge_number::MinMagnitudeNumber(huge_number::NaN(), huge_number::NaN()).isNaN());
}

TEST(Comparison, totalOrder)
{
	const std::vector<huge_number> ascending = {
			huge_number::NegativeInfinity(),
			huge_number::MinValue(),
			huge_number(-1, 50),
			huge_number(-25, -1),
			huge_number(-1, 3, 0),
			huge_number::NegativeZero(),
			huge_number::Zero(),
			huge_number::Epsilon(),
			huge_number(1, 3, 0),
			huge_number(5, -1),
			huge_number::One(),
			huge_number(1, 50),
			huge_number::MaxValue(),
			huge_number::PositiveInfinity(),
	};

	for(size_t i = 0; i < ascending.size(); ++i) {
		ASSERT_EQ(0, huge_number::CompareTo(ascending[i], ascending[i]));

		for(size_t j = i + 1; j < ascending.size(); ++j) {
			ASSERT_TRUE(ascending[i] < ascending[j]) << ascending[i] << " < " << ascending[j];
			ASSERT_FALSE(ascending[j] < ascending[i]) << ascending[j] << " < " << ascending[i];
			ASSERT_NE(ascending[i], ascending[j]);
		}
	}
}
