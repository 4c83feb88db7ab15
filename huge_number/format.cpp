#include "format.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>

#include <cctype>
#include <ostream>
#include <stdexcept>

//#define TRACE_FORMAT	1

#ifndef TRACE_FORMAT
#define TRACE_FORMAT	0 // don't test
#endif



//-TYPE-DEFINITIONS----------------------------------------------------------------------------------------------------

using umantissa_t = huge_number::umantissa_t;
using denominator_t = huge_number::denominator_t;
using MidpointRounding = huge_number::MidpointRounding;



//-CONSTANT-DEFINITIONS------------------------------------------------------------------------------------------------

static const char *const DefaultFormat = "G";

// Exponent digits kept while reading text, anything beyond overflows the exponent anyway
static constexpr int ExponentTextLimit = 1000000;

// Longest precision accepted in a format string
static constexpr size_t PrecisionTextLimit = 3;

static constexpr int ScientificDefaultPrecision = 6;
static constexpr int FixedDefaultPrecision = 2;
static constexpr int ScientificExponentDigits = 3;

const format_info &format_info::Invariant()
{
	static const format_info info;
	return info;
}



//-TEXT-HELPERS--------------------------------------------------------------------------------------------------------

static inline bool isDigit(char c) noexcept
{
	return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static inline bool isSpace(char c) noexcept
{
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Whether text[pos, end) begins with prefix
static bool startsWith(const std::string &text, size_t pos, size_t end, const std::string &prefix)
{
	return !prefix.empty() && end - pos >= prefix.size() && text.compare(pos, prefix.size(), prefix) == 0;
}

// Whether text[pos, end) ends with suffix
static bool endsWith(const std::string &text, size_t pos, size_t end, const std::string &suffix)
{
	return !suffix.empty() && end - pos >= suffix.size() && text.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}



//-PARSING-------------------------------------------------------------------------------------------------------------

// Reads digits[.digits][e[sign]digits][/denominator] from text[pos, end)
static bool parseBody(const std::string &text, size_t pos, size_t end, number_styles style, const format_info &info,
					  bool negative, huge_number &result)
{
	std::string digits;
	int exponent = 0;
	bool point = false;

	while(pos < end) {
		if(isDigit(text[pos])) {
			digits += text[pos++];

			if(point)
				--exponent;
		}
		else if(!point && hasStyle(style, number_styles::AllowDecimalPoint)
				&& startsWith(text, pos, end, info.decimalSeparator)) {
			point = true;
			pos += info.decimalSeparator.size();
		}
		else if(!point && !digits.empty() && hasStyle(style, number_styles::AllowThousands)
				&& startsWith(text, pos, end, info.groupSeparator))
			pos += info.groupSeparator.size();
		else
			break;
	}

	if(digits.empty())
		return false;

	if(pos < end && (text[pos] == 'e' || text[pos] == 'E') && hasStyle(style, number_styles::AllowExponent)) {
		bool exponentNegative = false;

		++pos;

		if(startsWith(text, pos, end, info.negativeSign)) {
			exponentNegative = true;
			pos += info.negativeSign.size();
		}
		else if(startsWith(text, pos, end, info.positiveSign))
			pos += info.positiveSign.size();

		const size_t first = pos;
		int written = 0;

		for(; pos < end && isDigit(text[pos]); ++pos) {
			if(written < ExponentTextLimit)
				written = written * 10 + (text[pos] - '0');
		}

		if(pos == first)
			return false;

		exponent += exponentNegative ? -written : written;
	}

	umantissa_t denominator = huge_number::DefaultDenominator;
	bool fraction = false;

	if(pos < end && text[pos] == '/') {
		const size_t first = ++pos;

		fraction = true;
		denominator = 0;

		for(; pos < end && isDigit(text[pos]); ++pos) {
			if(denominator <= huge_number::umantissa_t(huge_number::MaxMantissa))
				denominator = denominator * 10 + umantissa_t(text[pos] - '0');
		}

		if(pos == first || !denominator)
			return false;
	}

	if(pos != end)
		return false;

	huge_number value = fromDigits(negative, digits, exponent);

	if(value.isZero() && negative)
		value = huge_number::NegativeZero();

	if(fraction) {
		if(denominator <= huge_number::MaxDenominator && value.isFinite() && !value.isZero())
			value = huge_number(value.mantissa(), denominator_t(denominator), value.exponent());
		else
			value = huge_number::Divide(value, denominator);
	}

	result = value;
	return true;
}

bool huge_number::TryParse(const std::string &text, number_styles style, const format_info &info, huge_number &result)
{
	result = NaN();

	size_t pos = 0, end = text.size();

	if(hasStyle(style, number_styles::AllowLeadingWhite))
		while(pos < end && isSpace(text[pos]))
			++pos;

	if(hasStyle(style, number_styles::AllowTrailingWhite))
		while(end > pos && isSpace(text[end - 1]))
			--end;

	if(pos == end) {
		if(TRACE_FORMAT) BOOST_LOG_TRIVIAL(trace) << "TryParse empty text";

		return false;
	}

	// Symbols stand for the whole value
	const std::string trimmed = text.substr(pos, end - pos);

	if(trimmed == info.nanSymbol)
		return true;

	if(trimmed == info.positiveInfinitySymbol) {
		result = PositiveInfinity();
		return true;
	}

	if(trimmed == info.negativeInfinitySymbol) {
		result = NegativeInfinity();
		return true;
	}

	bool negative = false, signSeen = false;

	if(hasStyle(style, number_styles::AllowParentheses) && end - pos >= 2 && text[pos] == '(' && text[end - 1] == ')') {
		negative = signSeen = true;
		++pos;
		--end;
	}

	if(!signSeen && hasStyle(style, number_styles::AllowLeadingSign)) {
		if(startsWith(text, pos, end, info.negativeSign)) {
			negative = signSeen = true;
			pos += info.negativeSign.size();
		}
		else if(startsWith(text, pos, end, info.positiveSign)) {
			signSeen = true;
			pos += info.positiveSign.size();
		}
	}

	if(hasStyle(style, number_styles::AllowCurrencySymbol) && startsWith(text, pos, end, info.currencySymbol))
		pos += info.currencySymbol.size();

	if(!signSeen && hasStyle(style, number_styles::AllowTrailingSign)) {
		if(endsWith(text, pos, end, info.negativeSign)) {
			negative = true;
			end -= info.negativeSign.size();
		}
		else if(endsWith(text, pos, end, info.positiveSign))
			end -= info.positiveSign.size();
	}

	if(!parseBody(text, pos, end, style, info, negative, result)) {
		if(TRACE_FORMAT) BOOST_LOG_TRIVIAL(trace) << "TryParse rejected \"" << text << "\"";

		result = NaN();
		return false;
	}

	return true;
}

bool huge_number::TryParse(const std::string &text, huge_number &result)
{
	return TryParse(text, number_styles::Any, format_info::Invariant(), result);
}

huge_number huge_number::Parse(const std::string &text, number_styles style, const format_info &info)
{
	huge_number result;

	return TryParse(text, style, info, result) ? result : NaN();
}

huge_number huge_number::Parse(const std::string &text)
{
	return Parse(text, number_styles::Any, format_info::Invariant());
}



//-FORMATTING-HELPERS--------------------------------------------------------------------------------------------------

// Decimal digits of the mantissa magnitude
static std::string digitsOf(const huge_number &value)
{
	const auto mantissa = value.mantissa();

	return std::to_string(mantissa < 0 ? umantissa_t(0) - umantissa_t(mantissa) : umantissa_t(mantissa));
}

// Exponent of the leading digit
static int adjustedExponent(const huge_number &value)
{
	return value.isZero() ? 0 : int(value.exponent()) + int(value.mantissaDigits()) - 1;
}

static std::string group(const std::string &digits, const format_info &info)
{
	if(!info.groupSize || info.groupSeparator.empty())
		return digits;

	std::string result;
	const size_t count = digits.size();

	for(size_t i = 0; i < count; ++i) {
		if(i && (count - i) % info.groupSize == 0)
			result += info.groupSeparator;

		result += digits[i];
	}

	return result;
}

// Fixed notation of a decimal magnitude, padded to at least decimals fractional digits
static std::string fixedText(const huge_number &value, int decimals, bool grouped, const format_info &info)
{
	const std::string digits = digitsOf(value);
	const int
			exponent = value.exponent(),
			count = int(digits.size());

	std::string whole, fraction;

	if(value.isZero())
		whole = "0";
	else if(exponent >= 0)
		whole = digits + std::string(size_t(exponent), '0');
	else if(count > -exponent) {
		whole = digits.substr(0, size_t(count + exponent));
		fraction = digits.substr(size_t(count + exponent));
	}
	else {
		whole = "0";
		fraction = std::string(size_t(-exponent - count), '0') + digits;
	}

	if(int(fraction.size()) < decimals)
		fraction.append(size_t(decimals) - fraction.size(), '0');

	std::string result = grouped ? group(whole, info) : whole;

	if(!fraction.empty())
		result += info.decimalSeparator + fraction;

	return result;
}

// d.ddd followed by the exponent of the leading digit
static std::string scientificText(std::string digits, int adjusted, int precision, int exponentDigits, bool upper,
								  const format_info &info)
{
	const auto last = digits.find_last_not_of('0');
	digits.erase(last == std::string::npos ? 1 : last + 1);

	// Fixed precision pads the digits, -1 keeps all of them
	if(precision >= 0)
		digits.resize(size_t(precision) + 1, '0');

	std::string result(1, digits[0]);

	if(digits.size() > 1)
		result += info.decimalSeparator + digits.substr(1);

	std::string exponent = std::to_string(adjusted < 0 ? -adjusted : adjusted);

	if(int(exponent.size()) < exponentDigits)
		exponent.insert(0, size_t(exponentDigits) - exponent.size(), '0');

	return result + (upper ? "E" : "e") + (adjusted < 0 ? info.negativeSign : info.positiveSign) + exponent;
}

// Shortest text that reads back as the same fields
static std::string generalText(const huge_number &value, bool upper, const format_info &info)
{
	if(value.isRational()) {
		const huge_number numerator(value.mantissa(), value.exponent());

		return generalText(numerator, upper, info) + "/" + std::to_string(value.denominator());
	}

	const int
			exponent = value.exponent(),
			adjusted = adjustedExponent(value);

	if(value.isZero() || exponent == 0)
		return digitsOf(value);

	if(exponent < 0 && adjusted >= -5)
		return fixedText(value, 0, false, info);

	return scientificText(digitsOf(value), adjusted, -1, 0, upper, info);
}

// Value rounded half away from zero to the given number of significant digits
static huge_number roundSignificant(const huge_number &value, int digits)
{
	return huge_number::Round(value, digits - 1 - adjustedExponent(huge_number::ToDecimal(value)), MidpointRounding::AwayFromZero);
}



//-FORMATTING----------------------------------------------------------------------------------------------------------

std::string huge_number::ToString(const huge_number &value, const std::string &format, const format_info &info)
{
	const std::string specifier = format.empty() ? std::string(DefaultFormat) : format;
	const char kind = char(std::tolower(static_cast<unsigned char>(specifier[0])));
	const bool upper = std::isupper(static_cast<unsigned char>(specifier[0])) != 0;

	// Optional precision after the format letter
	int precision = -1;

	if(specifier.size() > 1) {
		const std::string digits = specifier.substr(1);

		if(digits.size() > PrecisionTextLimit || digits.find_first_not_of("0123456789") != std::string::npos)
			throw std::invalid_argument("invalid format string \"" + format + "\"");

		precision = std::stoi(digits);
	}

	switch(kind) {
		case 'g': case 'r': case 'e': case 'f': case 'n': case 'p': case 'c':
			break;
		default:
			throw std::invalid_argument("invalid format string \"" + format + "\"");
	}

	const huge_number number = kind == 'p' ? Multiply(value, 100) : value;

	if(number.isNaN())
		return info.nanSymbol;
	if(number.isPositiveInfinity())
		return info.positiveInfinitySymbol;
	if(number.isNegativeInfinity())
		return info.negativeInfinitySymbol;

	const std::string sign = number.isNegative() ? info.negativeSign : std::string();
	const huge_number magnitude = Abs(number);

	if(kind == 'g' && precision > 0)
		return sign + generalText(roundSignificant(magnitude, precision), upper, info);

	if(kind == 'g' || kind == 'r')
		return sign + generalText(magnitude, upper, info);

	if(kind == 'e') {
		const int decimals = precision < 0 ? ScientificDefaultPrecision : precision;
		const huge_number rounded = roundSignificant(magnitude, decimals + 1);

		return sign + scientificText(digitsOf(rounded), adjustedExponent(rounded), decimals, ScientificExponentDigits, upper, info);
	}

	const int decimals = precision < 0 ? FixedDefaultPrecision : precision;
	const std::string text = fixedText(Round(magnitude, decimals, MidpointRounding::AwayFromZero), decimals, kind != 'f', info);

	if(kind == 'p')
		return sign + text + " " + info.percentSymbol;
	if(kind == 'c')
		return sign + info.currencySymbol + text;

	return sign + text;
}

std::string huge_number::ToString(const huge_number &value, const std::string &format)
{
	return ToString(value, format, format_info::Invariant());
}

std::string huge_number::ToString(const huge_number &value)
{
	return ToString(value, DefaultFormat, format_info::Invariant());
}

std::string huge_number::toString() const
{
	return ToString(*this);
}

std::ostream &operator<<(std::ostream &out, const huge_number &value)
{
	return out << huge_number::ToString(value);
}
