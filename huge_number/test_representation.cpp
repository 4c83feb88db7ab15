#include "huge_number.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using mantissa_t = huge_number::mantissa_t;
using exponent_t = huge_number::exponent_t;
using denominator_t = huge_number::denominator_t;

static void expectFields(mantissa_t mantissa, exponent_t exponent, denominator_t denominator, const huge_number &value)
{
	EXPECT_EQ(mantissa, value.mantissa());
	EXPECT_EQ(exponent, value.exponent());
	EXPECT_EQ(denominator, value.denominator());
}

TEST(Representation, defaultIsZero)
{
	huge_number value;

	expectFields(0, 0, 1, value);
	ASSERT_TRUE(value.isZero());
	ASSERT_FALSE(value.isNegative());
}

TEST(Representation, normalizesMantissaWidth)
{
	expectFields(100000000000000000, 33, 1, huge_number(1e50));
	expectFields(100000000000000000, 33, 1, huge_number(1, 50));
	expectFields(10, 0, 1, huge_number(1, 1));
	expectFields(12, 0, 1, huge_number(1200, -2));
	expectFields(1, -1, 1, huge_number(0.1));
}

TEST(Representation, constructionPathsAgree)
{
	ASSERT_EQ(huge_number(12), huge_number(1200, -2));
	ASSERT_EQ(huge_number(15, -1), huge_number(1.5));
	ASSERT_EQ(huge_number(15, -1), huge_number(15, 1, -1));
	ASSERT_EQ(huge_number(3, 2), huge_number::FromDouble(3, 2));
}

TEST(Representation, overflowAndUnderflow)
{
	ASSERT_TRUE(huge_number(1, 40000).isPositiveInfinity());
	ASSERT_TRUE(huge_number(-1, 40000).isNegativeInfinity());
	ASSERT_EQ(huge_number::Zero(), huge_number(1, -40000));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number(-1, -40000));
}

TEST(Representation, rationalFactorsCancel)
{
	expectFields(1, 0, 2, huge_number(2, 4, 0));
	ASSERT_EQ(huge_number::One(), huge_number(3, 3, 0));
	ASSERT_TRUE(huge_number(1, 3, 0).isRational());
	ASSERT_FALSE(huge_number(15, -1).isRational());
}

TEST(Representation, sentinelDenominator)
{
	ASSERT_TRUE(huge_number(5, 0, 0).isPositiveInfinity());
	ASSERT_TRUE(huge_number(-5, 0, 0).isNegativeInfinity());
	ASSERT_TRUE(huge_number(0, 0, 0).isNaN());
}

TEST(Representation, doubleSpecials)
{
	ASSERT_EQ(huge_number::NegativeZero(), huge_number(-0.0));
	ASSERT_TRUE(huge_number(std::numeric_limits<double>::infinity()).isPositiveInfinity());
	ASSERT_TRUE(huge_number(std::numeric_limits<double>::quiet_NaN()).isNaN());
}

TEST(Representation, predicates)
{
	ASSERT_TRUE(huge_number::NaN().isNaN());
	ASSERT_FALSE(huge_number::NaN().isFinite());
	ASSERT_TRUE(huge_number::NegativeZero().isNegative());
	ASSERT_TRUE(huge_number::NegativeZero().isZero());
	ASSERT_TRUE(huge_number::Zero().isPositive());
	ASSERT_EQ(-1, huge_number(-7).sign());
	ASSERT_TRUE(huge_number(15, -1).isNotRational());

	ASSERT_TRUE(huge_number(4).isEvenInteger());
	ASSERT_TRUE(huge_number(7).isOddInteger());
	ASSERT_TRUE(huge_number(1, 30).isInteger());
	ASSERT_FALSE(huge_number(1, 2, 0).isInteger());
	ASSERT_FALSE(huge_number(15, -1).isInteger());
	ASSERT_FALSE(huge_number::PositiveInfinity().isInteger());

	ASSERT_TRUE(huge_number(1, -16).isNearlyZero());
	ASSERT_FALSE(huge_number(1, -10).isNearlyZero());
}

TEST(Representation, toDouble)
{
	ASSERT_EQ(1.5, huge_number(15, -1).toDouble());
	ASSERT_EQ(0.25, huge_number(1, 4, 0).toDouble());
	ASSERT_TRUE(std::isinf(huge_number::NegativeInfinity().toDouble()));
	ASSERT_TRUE(std::signbit(huge_number::NegativeZero().toDouble()));
}

TEST(Representation, toInt64)
{
	ASSERT_EQ(123456, huge_number(123456).toInt64());
	ASSERT_EQ(-2, huge_number(-25, -1).toInt64());
	ASSERT_EQ(1000000000000000000, huge_number(1, 18).toInt64());
	ASSERT_EQ(3u, huge_number(7, 2, 0).toUInt64());

	ASSERT_THROW(huge_number(1, 20).toInt64(), std::overflow_error);
	ASSERT_THROW(huge_number(-1).toUInt64(), std::overflow_error);
	ASSERT_THROW(huge_number::NaN().toInt64(), std::domain_error);
}

TEST(Representation, operators)
{
	huge_number value = 7;

	value += 3;
	ASSERT_EQ(huge_number(10), value);

	++value;
	ASSERT_EQ(huge_number(11), value);

	value--;
	value *= 2;
	ASSERT_EQ(huge_number(20), value);

	value /= 8;
	ASSERT_EQ(huge_number(5, 2, 0), value);

	ASSERT_EQ(huge_number(-3), -huge_number(3));
	ASSERT_TRUE(bool(huge_number(1, -5)));
	ASSERT_FALSE(bool(huge_number::Zero()));
}

TEST(Representation, ranges)
{
	const std::vector<huge_number> values = {1, 2, 3, 4};

	ASSERT_EQ(huge_number(10), huge_number::Sum(values.begin(), values.end()));
	ASSERT_EQ(huge_number(5, 2, 0), huge_number::Average(values.begin(), values.end()));
	ASSERT_EQ(huge_number(1), huge_number::Minimum(values.begin(), values.end()));
	ASSERT_EQ(huge_number(4), huge_number::Maximum(values.begin(), values.end()));
	ASSERT_TRUE(huge_number::Average(values.end(), values.end()).isNaN());
}
