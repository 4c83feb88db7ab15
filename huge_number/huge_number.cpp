#include "huge_number.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

//#define TRACE_HUGE_NUMBER	1

#ifndef TRACE_HUGE_NUMBER
#define TRACE_HUGE_NUMBER	0 // don't test
#endif



//-TYPE-DEFINITIONS----------------------------------------------------------------------------------------------------

using mantissa_t = huge_number::mantissa_t;
using umantissa_t = huge_number::umantissa_t;
using exponent_t = huge_number::exponent_t;
using denominator_t = huge_number::denominator_t;
using digits_t = huge_number::digits_t;



//-DIGIT-HELPERS-------------------------------------------------------------------------------------------------------

static int countDigits(umantissa_t magnitude) noexcept
{
	int digits = 0;

	while(magnitude) {
		magnitude /= 10;
		++digits;
	}

	return digits;
}

static umantissa_t magnitudeOf(mantissa_t value) noexcept
{
	return value < 0 ? umantissa_t(0) - umantissa_t(value) : umantissa_t(value);
}



//-CONSTRUCTORS--------------------------------------------------------------------------------------------------------

huge_number::huge_number(double value) :
		huge_number(FromDouble(value, 0)) {}

huge_number::huge_number(mantissa_t mantissa, int exponent) :
		huge_number(Reduce(mantissa, exponent)) {}

huge_number::huge_number(mantissa_t numerator, denominator_t denominator, int exponent)
{
	if(denominator == SentinelDenominator) {
		*this = numerator == 0 ? NaN() : numerator > 0 ? PositiveInfinity() : NegativeInfinity();
		return;
	}

	const bool negative = numerator < 0;

	*this = Reduce(negative, magnitudeOf(numerator), exponent);

	// Alternate factor elimination and reduction until neither changes the fields
	while(denominator > DefaultDenominator && isFinite() && m_mantissa) {
		const auto factor = GreatestCommonFactor(magnitudeOf(m_mantissa), denominator);

		if(factor == 1) {
			m_denominator = denominator;
			break;
		}

		denominator = denominator_t(denominator / factor);
		*this = Reduce(negative, magnitudeOf(m_mantissa) / factor, m_exponent);
	}
}

huge_number huge_number::FromDouble(double value, int exponent)
{
	if(std::isnan(value))
		return NaN();
	if(std::isinf(value))
		return value > 0 ? PositiveInfinity() : NegativeInfinity();
	if(value == 0)
		return std::signbit(value) ? NegativeZero() : Zero();

	// Shortest digits that read back as the same double
	char buffer[32];
	const auto converted = std::to_chars(buffer, buffer + sizeof(buffer), std::fabs(value), std::chars_format::scientific);

	if(converted.ec != std::errc())
		return NaN();

	return fromScientific(value < 0, std::string(buffer, converted.ptr), exponent);
}



//-NORMALIZER----------------------------------------------------------------------------------------------------------

huge_number huge_number::Reduce(bool negative, umantissa_t magnitude, int exponent)
{
	if(!magnitude)
		return Zero();

	int digits = countDigits(magnitude);

	// Pull the exponent into the mantissa while room remains
	while(digits < MantissaSignificantDigits && exponent > 0) {
		magnitude *= 10;
		--exponent;
		++digits;
	}

	// Push trailing zeros out of the mantissa into the exponent
	while(digits < MantissaSignificantDigits && exponent < 0 && magnitude % 10 == 0) {
		magnitude /= 10;
		++exponent;
		--digits;
	}

	// Digits beyond the mantissa width are lost
	while(magnitude > umantissa_t(MaxMantissa)) {
		magnitude /= 10;
		++exponent;
		--digits;
	}

	// Underflow sheds digits until the exponent is representable
	while(exponent < MinExponent && magnitude) {
		magnitude /= 10;
		++exponent;
	}

	if(!magnitude) {
		if(TRACE_HUGE_NUMBER) BOOST_LOG_TRIVIAL(trace) << "Reduce underflow negative " << negative;

		return negative ? NegativeZero() : Zero();
	}

	while(exponent < 0 && magnitude % 10 == 0) {
		magnitude /= 10;
		++exponent;
	}

	if(exponent > MaxExponent) {
		if(TRACE_HUGE_NUMBER) BOOST_LOG_TRIVIAL(trace) << "Reduce overflow exponent " << exponent << " negative " << negative;

		return negative ? NegativeInfinity() : PositiveInfinity();
	}

	const auto mantissa = mantissa_t(magnitude);

	return huge_number(negative ? -mantissa : mantissa, exponent_t(exponent), DefaultDenominator, RawFields{});
}

huge_number huge_number::Reduce(mantissa_t mantissa, int exponent)
{
	return Reduce(mantissa < 0, magnitudeOf(mantissa), exponent);
}

umantissa_t huge_number::GreatestCommonFactor(umantissa_t left, umantissa_t right) noexcept
{
	while(right) {
		left %= right;
		std::swap(left, right);
	}

	return left;
}

denominator_t huge_number::LeastCommonMultiple(denominator_t left, denominator_t right) noexcept
{
	if(!left || !right)
		return 0;

	const umantissa_t multiple = umantissa_t(left) / GreatestCommonFactor(left, right) * right;

	return multiple > MaxDenominator ? 0 : denominator_t(multiple);
}

huge_number huge_number::ToDecimal(const huge_number &value)
{
	if(!value.isRational())
		return value;

	// Twenty extra digits of quotient, the remainder rounds the last one away from zero
	static constexpr unsigned ExtraDigits = 20;

	const wide_int_t
			denominator = value.m_denominator,
			numerator = wide_int_t(value.m_mantissa) * pow10Wide(ExtraDigits),
			half = value.m_mantissa < 0 ? wide_int_t(-(denominator / 2)) : wide_int_t(denominator / 2);

	return fromWideInt((numerator + half) / denominator, int(value.m_exponent) - int(ExtraDigits));
}



//-MEMBER-ACCESSORS----------------------------------------------------------------------------------------------------

digits_t huge_number::mantissaDigits() const noexcept
{
	return digits_t(countDigits(magnitudeOf(m_mantissa)));
}

bool huge_number::isInteger() const
{
	if(!isFinite())
		return false;
	if(!m_mantissa)
		return true;
	if(m_denominator == DefaultDenominator)
		return m_exponent >= 0;
	if(m_exponent <= 0)
		return false;

	// The denominator has to divide numerator * 10^exponent
	umantissa_t remainder = magnitudeOf(m_mantissa) % m_denominator;

	for(int i = 0; i < m_exponent && remainder; ++i)
		remainder = remainder * 10 % m_denominator;

	return !remainder;
}

bool huge_number::isEvenInteger() const
{
	return isInteger() && Mod(*this, 2).isZero();
}

bool huge_number::isOddInteger() const
{
	return isInteger() && !Mod(*this, 2).isZero();
}

bool huge_number::isNearlyZero() const
{
	return Less(*this, NearlyZero()) && More(*this, Negate(NearlyZero()));
}

bool huge_number::isNearlyEqualTo(const huge_number &other) const
{
	return isNearlyEqualTo(other, GetEpsilon(Max(*this, other)));
}

bool huge_number::isNearlyEqualTo(const huge_number &other, const huge_number &epsilon) const
{
	return Equal(*this, other) || Less(Abs(Subtract(*this, other)), epsilon);
}



//-CONVERSIONS---------------------------------------------------------------------------------------------------------

double huge_number::toDouble() const noexcept
{
	if(isNaN())
		return std::numeric_limits<double>::quiet_NaN();
	if(isInfinity())
		return m_mantissa > 0 ? std::numeric_limits<double>::infinity() : -std::numeric_limits<double>::infinity();
	if(isNegativeZero())
		return -0.0;

	const std::string text = std::to_string(m_mantissa) + "e" + std::to_string(m_exponent);
	const double result = std::strtod(text.c_str(), nullptr);

	return isRational() ? result / m_denominator : result;
}

int64_t huge_number::toInt64() const
{
	if(isNaN())
		throw std::domain_error("NaN has no integer value");

	const huge_number truncated = Truncate(*this);

	if(isInfinity()
	   || More(truncated, std::numeric_limits<int64_t>::max())
	   || Less(truncated, std::numeric_limits<int64_t>::min()))
		throw std::overflow_error("value " + toString() + " is out of the int64 range");

	int64_t result = truncated.m_mantissa;

	for(int i = 0; i < truncated.m_exponent; ++i)
		result *= 10;

	return result;
}

uint64_t huge_number::toUInt64() const
{
	if(isNaN())
		throw std::domain_error("NaN has no integer value");

	const huge_number truncated = Truncate(*this);

	if(isInfinity()
	   || truncated.m_mantissa < 0
	   || More(truncated, std::numeric_limits<uint64_t>::max()))
		throw std::overflow_error("value " + toString() + " is out of the uint64 range");

	uint64_t result = magnitudeOf(truncated.m_mantissa);

	for(int i = 0; i < truncated.m_exponent; ++i)
		result *= 10;

	return result;
}



//-OPERATORS-----------------------------------------------------------------------------------------------------------

huge_number huge_number::operator-() const
{
	return Negate(*this);
}

huge_number &huge_number::operator+=(const huge_number &other)
{
	return *this = Add(*this, other);
}

huge_number &huge_number::operator-=(const huge_number &other)
{
	return *this = Subtract(*this, other);
}

huge_number &huge_number::operator*=(const huge_number &other)
{
	return *this = Multiply(*this, other);
}

huge_number &huge_number::operator/=(const huge_number &other)
{
	return *this = Divide(*this, other);
}

huge_number &huge_number::operator%=(const huge_number &other)
{
	return *this = Mod(*this, other);
}

huge_number &huge_number::operator++()
{
	return *this = Increment(*this);
}

huge_number &huge_number::operator--()
{
	return *this = Decrement(*this);
}

huge_number huge_number::operator++(int)
{
	const huge_number result = *this;
	*this = Increment(*this);
	return result;
}

huge_number huge_number::operator--(int)
{
	const huge_number result = *this;
	*this = Decrement(*this);
	return result;
}
