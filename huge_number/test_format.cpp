#include "huge_number.hpp"
#include "format.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

TEST(Format, general)
{
	ASSERT_EQ("1.5", huge_number::ToString(huge_number(15, -1)));
	ASSERT_EQ("-2.5", huge_number::ToString(huge_number(-25, -1)));
	ASSERT_EQ("1234", huge_number::ToString(huge_number(1234)));
	ASSERT_EQ("0.00001", huge_number::ToString(huge_number(1, -5)));
	ASSERT_EQ("1E-7", huge_number::ToString(huge_number(1, -7)));
	ASSERT_EQ("1E+50", huge_number::ToString(huge_number(1, 50)));
	ASSERT_EQ("1e+50", huge_number::ToString(huge_number(1, 50), "g"));
	ASSERT_EQ("1/3", huge_number::ToString(huge_number(1, 3, 0)));
	ASSERT_EQ("-0", huge_number::ToString(huge_number::NegativeZero()));
	ASSERT_EQ("0", huge_number::ToString(huge_number::Zero()));
}

TEST(Format, specialValues)
{
	ASSERT_EQ("NaN", huge_number::ToString(huge_number::NaN()));
	ASSERT_EQ("Infinity", huge_number::ToString(huge_number::PositiveInfinity(), "F2"));
	ASSERT_EQ("-Infinity", huge_number::ToString(huge_number::NegativeInfinity(), "E"));
}

TEST(Format, generalPrecision)
{
	ASSERT_EQ("3.14", huge_number::ToString(huge_number(314159, -5), "G3"));
	ASSERT_EQ("1.2E+20", huge_number::ToString(huge_number(123, 18), "G2"));
}

TEST(Format, scientific)
{
	ASSERT_EQ("1.234560E+003", huge_number::ToString(huge_number(123456, -2), "E"));
	ASSERT_EQ("1.23e+003", huge_number::ToString(huge_number(123456, -2), "e2"));
	ASSERT_EQ("-5.0E-004", huge_number::ToString(huge_number(-5, -4), "E1"));
}

TEST(Format, fixedAndNumber)
{
	ASSERT_EQ("1234.57", huge_number::ToString(huge_number(12345678, -4), "F2"));
	ASSERT_EQ("1,234.57", huge_number::ToString(huge_number(12345678, -4), "N2"));
	ASSERT_EQ("1235", huge_number::ToString(huge_number(12345678, -4), "F0"));
	ASSERT_EQ("3.00", huge_number::ToString(huge_number(3), "F"));
	ASSERT_EQ("1,234,567", huge_number::ToString(huge_number(1234567), "N0"));
	ASSERT_EQ("0.33", huge_number::ToString(huge_number(1, 3, 0), "F"));
	ASSERT_EQ("-0.500", huge_number::ToString(huge_number(-5, -1), "F3"));
}

TEST(Format, percentAndCurrency)
{
	ASSERT_EQ("12.5 %", huge_number::ToString(huge_number(125, -3), "P1"));
	ASSERT_EQ("50.00 %", huge_number::ToString(huge_number(1, 2, 0), "P"));
	ASSERT_EQ("¤1,234.50", huge_number::ToString(huge_number(12345, -1), "C"));
	ASSERT_EQ("-¤3.00", huge_number::ToString(huge_number(-3), "C"));
}

TEST(Format, invalidFormatThrows)
{
	ASSERT_THROW(huge_number::ToString(huge_number(1), "X"), std::invalid_argument);
	ASSERT_THROW(huge_number::ToString(huge_number(1), "F1234"), std::invalid_argument);
	ASSERT_THROW(huge_number::ToString(huge_number(1), "Fx"), std::invalid_argument);
}

TEST(Format, customSymbols)
{
	format_info info;
	info.decimalSeparator = ",";
	info.groupSeparator = ".";

	ASSERT_EQ("1.234,5", huge_number::ToString(huge_number(12345, -1), "N1", info));
	ASSERT_EQ(huge_number(12345, -1), huge_number::Parse("1.234,5", number_styles::Number, info));
}

TEST(Format, parse)
{
	ASSERT_EQ(huge_number(15, -1), huge_number::Parse("1.5"));
	ASSERT_EQ(huge_number(-12345, -1), huge_number::Parse("  -1,234.5  "));
	ASSERT_EQ(huge_number(-42), huge_number::Parse("(42)"));
	ASSERT_EQ(huge_number(1500), huge_number::Parse("1.5e3"));
	ASSERT_EQ(huge_number(25, -4), huge_number::Parse("2.5E-3"));
	ASSERT_EQ(huge_number(-12), huge_number::Parse("12-"));
	ASSERT_EQ(huge_number(5), huge_number::Parse("¤5"));
	ASSERT_EQ(huge_number(1, 3, 0), huge_number::Parse("1/3"));
	ASSERT_EQ(huge_number::NegativeZero(), huge_number::Parse("-0"));
	ASSERT_EQ(huge_number::PositiveInfinity(), huge_number::Parse("Infinity"));
	ASSERT_EQ(huge_number::NegativeInfinity(), huge_number::Parse("-Infinity"));
	ASSERT_TRUE(huge_number::Parse("1e99999").isPositiveInfinity());
}

TEST(Format, parseRejects)
{
	huge_number value;

	ASSERT_FALSE(huge_number::TryParse("abc", value));
	ASSERT_TRUE(value.isNaN());
	ASSERT_FALSE(huge_number::TryParse("", value));
	ASSERT_FALSE(huge_number::TryParse("1.2.3", value));
	ASSERT_FALSE(huge_number::TryParse("1e", value));
	ASSERT_FALSE(huge_number::TryParse("1/0", value));
	ASSERT_FALSE(huge_number::TryParse("1.5", number_styles::Integer, format_info::Invariant(), value));
	ASSERT_FALSE(huge_number::TryParse(" 1", number_styles::None, format_info::Invariant(), value));
	ASSERT_TRUE(huge_number::Parse("abc").isNaN());

	ASSERT_TRUE(huge_number::TryParse("NaN", value));
	ASSERT_TRUE(value.isNaN());
}

TEST(Format, roundTrip)
{
	const std::vector<huge_number> values = {
			huge_number(1, 50),
			huge_number(-25, -1),
			huge_number(1, 3, 0),
			huge_number(7, 3, -2),
			huge_number(123456789012345678, -30),
			huge_number::NegativeZero(),
			huge_number::MaxValue(),
			huge_number::Epsilon(),
	};

	for(const auto &value : values)
		ASSERT_EQ(value, huge_number::Parse(huge_number::ToString(value, "R")));
}

TEST(Format, stream)
{
	std::ostringstream out;

	out << huge_number(15, -1) << " " << huge_number(1, 3, 0);

	ASSERT_EQ("1.5 1/3", out.str());
	ASSERT_EQ("1.5", huge_number(15, -1).toString());
}
