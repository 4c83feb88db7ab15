#include "wide.hpp"

#include <boost/log/trivial.hpp>

#include <limits>

//#define TRACE_WIDE	1

#ifndef TRACE_WIDE
#define TRACE_WIDE	0 // don't test
#endif

using mantissa_t = huge_number::mantissa_t;
using umantissa_t = huge_number::umantissa_t;
using denominator_t = huge_number::denominator_t;



//-WIDE-INTEGER-HELPERS------------------------------------------------------------------------------------------------

wide_int_t pow10Wide(unsigned exponent)
{
	return mp::pow(wide_int_t(10), exponent);
}

unsigned wideDigits(const wide_int_t &value)
{
	if(value == 0)
		return 0;

	return unsigned(mp::abs(value).str().size());
}

static wide_int_t wideGcd(wide_int_t left, wide_int_t right)
{
	while(right != 0) {
		left %= right;
		std::swap(left, right);
	}

	return left;
}



//-CONVERSIONS---------------------------------------------------------------------------------------------------------

wide_float_t toWideFloat(const huge_number &value)
{
	if(value.isNaN())
		return std::numeric_limits<wide_float_t>::quiet_NaN();
	if(value.isInfinity())
		return value.sign() * std::numeric_limits<wide_float_t>::infinity();

	const std::string text = std::to_string(value.mantissa()) + "e" + std::to_string(value.exponent());
	wide_float_t result(text.c_str());

	if(value.isRational())
		result /= value.denominator();

	return result;
}

huge_number fromDigits(bool negative, std::string digits, int exponent)
{
	const auto first = digits.find_first_not_of('0');

	if(first == std::string::npos)
		return huge_number::Zero();

	digits.erase(0, first);

	// Round half away from zero on the first digit that does not fit
	bool roundUp = false;

	if(digits.size() > huge_number::MantissaSignificantDigits) {
		roundUp = digits[huge_number::MantissaSignificantDigits] >= '5';
		exponent += int(digits.size() - huge_number::MantissaSignificantDigits);
		digits.resize(huge_number::MantissaSignificantDigits);
	}

	umantissa_t magnitude = 0;

	for(const char digit : digits)
		magnitude = magnitude * 10 + umantissa_t(digit - '0');

	return huge_number::Reduce(negative, magnitude + umantissa_t(roundUp), exponent);
}

huge_number fromScientific(bool negative, const std::string &text, int exponent)
{
	const auto marker = text.find_first_of("eE");

	std::string digits = text.substr(0, marker);

	if(marker != std::string::npos)
		exponent += std::stoi(text.substr(marker + 1));

	const auto point = digits.find('.');

	if(point != std::string::npos) {
		exponent -= int(digits.size() - point - 1);
		digits.erase(point, 1);
	}

	return fromDigits(negative, std::move(digits), exponent);
}

huge_number fromWideInt(const wide_int_t &value, int exponent)
{
	return fromDigits(value < 0, mp::abs(value).str(), exponent);
}

huge_number fromWideFloat(const wide_float_t &value, int exponent)
{
	if(mp::isnan(value))
		return huge_number::NaN();
	if(mp::isinf(value))
		return value > 0 ? huge_number::PositiveInfinity() : huge_number::NegativeInfinity();
	if(value == 0)
		return huge_number::Zero();

	// A few guard digits beyond the mantissa width, rounded by fromDigits
	const std::string text = wide_float_t(mp::abs(value)).str(huge_number::MantissaSignificantDigits + 4, std::ios_base::scientific);

	if(TRACE_WIDE) BOOST_LOG_TRIVIAL(trace) << "fromWideFloat " << text << " e" << exponent;

	return fromScientific(value < 0, text, exponent);
}

huge_number fromWideRatio(wide_int_t numerator, wide_int_t denominator, int exponent)
{
	if(denominator < 0) {
		numerator = -numerator;
		denominator = -denominator;
	}

	const wide_int_t factor = wideGcd(mp::abs(numerator), denominator);

	if(factor > 1) {
		numerator /= factor;
		denominator /= factor;
	}

	if(denominator == 1)
		return fromWideInt(numerator, exponent);

	if(denominator <= huge_number::MaxDenominator && mp::abs(numerator) <= huge_number::MaxMantissa)
		return huge_number(numerator.convert_to<mantissa_t>(), denominator.convert_to<denominator_t>(), exponent);

	if(TRACE_WIDE) BOOST_LOG_TRIVIAL(trace) << "fromWideRatio decimal fallback " << numerator << "/" << denominator << " e" << exponent;

	return fromWideFloat(wide_float_t(numerator.str().c_str()) / wide_float_t(denominator.str().c_str()), exponent);
}
