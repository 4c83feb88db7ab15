#pragma once

#include "huge_number.hpp"

#include <string>

// Symbols used to read and write text
struct format_info {
	std::string nanSymbol = "NaN";
	std::string positiveInfinitySymbol = "Infinity";
	std::string negativeInfinitySymbol = "-Infinity";
	std::string positiveSign = "+";
	std::string negativeSign = "-";
	std::string decimalSeparator = ".";
	std::string groupSeparator = ",";
	std::string currencySymbol = "¤";
	std::string percentSymbol = "%";
	unsigned groupSize = 3;

	// Culture independent defaults
	static const format_info &Invariant();
};

// Text elements accepted by TryParse
enum class number_styles : unsigned {
	None = 0,
	AllowLeadingWhite = 1u << 0,
	AllowTrailingWhite = 1u << 1,
	AllowLeadingSign = 1u << 2,
	AllowTrailingSign = 1u << 3,
	AllowParentheses = 1u << 4,
	AllowDecimalPoint = 1u << 5,
	AllowThousands = 1u << 6,
	AllowExponent = 1u << 7,
	AllowCurrencySymbol = 1u << 8,

	Integer = AllowLeadingWhite | AllowTrailingWhite | AllowLeadingSign,
	Float = Integer | AllowDecimalPoint | AllowExponent,
	Number = Integer | AllowTrailingSign | AllowDecimalPoint | AllowThousands,
	Currency = Number | AllowParentheses | AllowCurrencySymbol,
	Any = Currency | AllowExponent
};

inline constexpr number_styles operator|(number_styles left, number_styles right) noexcept
{
	return number_styles(unsigned(left) | unsigned(right));
}

inline constexpr number_styles operator&(number_styles left, number_styles right) noexcept
{
	return number_styles(unsigned(left) & unsigned(right));
}

inline constexpr bool hasStyle(number_styles style, number_styles flag) noexcept
{
	return (style & flag) == flag;
}
