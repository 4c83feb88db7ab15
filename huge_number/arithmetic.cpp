#include "huge_number.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>

//#define TRACE_ARITHMETIC	1

#ifndef TRACE_ARITHMETIC
#define TRACE_ARITHMETIC	0 // don't test
#endif



//-TYPE-DEFINITIONS----------------------------------------------------------------------------------------------------

using mantissa_t = huge_number::mantissa_t;
using umantissa_t = huge_number::umantissa_t;
using denominator_t = huge_number::denominator_t;



//-NUMBER-ARITHMETIC-PRELIMINARY-CHECKS--------------------------------------------------------------------------------
//    These functions are run before the actual computation to do bound checking, and return true if they pass
//    If they return false, they MUST set the result and that value will be returned

static inline huge_number signedInfinity(bool negative)
{
	return negative ? huge_number::NegativeInfinity() : huge_number::PositiveInfinity();
}

static inline huge_number signedZero(bool negative)
{
	return negative ? huge_number::NegativeZero() : huge_number::Zero();
}

static bool checkAdd(huge_number &result, const huge_number &left, const huge_number &right)
{
	const bool
			leftNan = left.isNaN(),
			rightNan = right.isNaN(),
			leftInfinity = left.isInfinity(),
			rightInfinity = right.isInfinity(),
			leftZero = left.isZero(),
			rightZero = right.isZero();

	if(leftNan | rightNan | (leftInfinity & rightInfinity & (left.sign() != right.sign())))
		result = huge_number::NaN();
	else if(leftInfinity)
		result = left;
	else if(rightInfinity)
		result = right;
	else if(leftZero & rightZero)
		result = signedZero(left.isNegativeZero() & right.isNegativeZero());
	else if(leftZero)
		result = right;
	else if(rightZero)
		result = left;
	else
		return true;
	return false;
}

static bool checkMultiply(huge_number &result, const huge_number &left, const huge_number &right)
{
	const bool
			leftNan = left.isNaN(),
			rightNan = right.isNaN(),
			leftZero = left.isZero(),
			rightZero = right.isZero();

	if(leftNan | rightNan)
		result = huge_number::NaN();
	else if(leftZero | rightZero)
		result = signedZero((left.exponent() < 0) != (right.exponent() < 0));
	else if(left.isInfinity() | right.isInfinity())
		result = signedInfinity(left.isNegative() != right.isNegative());
	else
		return true;
	return false;
}

static bool checkDivide(huge_number &result, const huge_number &dividend, const huge_number &divisor)
{
	const bool
			dividendNan = dividend.isNaN(),
			divisorNan = divisor.isNaN(),
			dividendZero = dividend.isZero(),
			divisorZero = divisor.isZero(),
			dividendInfinity = dividend.isInfinity(),
			divisorInfinity = divisor.isInfinity(),
			negative = dividend.isNegative() != divisor.isNegative();

	if(dividendNan | divisorNan | (dividendZero & divisorZero) | (dividendInfinity & divisorInfinity))
		result = huge_number::NaN();
	else if(divisorZero)
		result = signedInfinity(dividend.isNegative());
	else if(dividendZero)
		result = dividend;
	else if(dividendInfinity)
		result = signedInfinity(negative);
	else if(divisorInfinity)
		result = signedZero(negative);
	else
		return true;
	return false;
}

static bool checkMod(huge_number &result, const huge_number &dividend, const huge_number &divisor)
{
	const bool
			dividendNan = dividend.isNaN(),
			divisorNan = divisor.isNaN(),
			dividendZero = dividend.isZero(),
			divisorZero = divisor.isZero();

	if(dividendNan | divisorNan | (dividendZero & divisorZero))
		result = huge_number::NaN();
	else if(divisorZero | dividendZero | dividend.isInfinity() | divisor.isInfinity())
		result = huge_number::Zero();
	else
		return true;
	return false;
}

static bool checkRemainder(huge_number &result, const huge_number &x, const huge_number &y)
{
	if(x.isNaN() | y.isNaN() | x.isInfinity() | y.isZero())
		result = huge_number::NaN();
	else if(y.isInfinity() | x.isZero())
		result = x;
	else
		return true;
	return false;
}



//-EXACT-REMAINDER-----------------------------------------------------------------------------------------------------

// Computes |dividend| mod (multiple * |divisor|) exactly over a shared denominator
//     the value of the remainder is result * 10^exponent / denominator
static wide_int_t remainder(const huge_number &dividend, const huge_number &divisor, unsigned multiple,
							int &exponent, wide_int_t &denominator)
{
	denominator = wide_int_t(dividend.denominator()) * divisor.denominator()
				  / huge_number::GreatestCommonFactor(dividend.denominator(), divisor.denominator());

	const wide_int_t
			left = mp::abs(wide_int_t(dividend.mantissa())) * (denominator / dividend.denominator()),
			right = mp::abs(wide_int_t(divisor.mantissa())) * (denominator / divisor.denominator()) * multiple;

	if(dividend.exponent() >= divisor.exponent()) {
		exponent = divisor.exponent();

		// left * 10^gap mod right, with the power of ten reduced modulo right
		const unsigned gap = unsigned(dividend.exponent() - divisor.exponent());
		return wide_int_t(left % right) * wide_int_t(mp::powm(wide_int_t(10), wide_int_t(gap), right)) % right;
	}

	exponent = dividend.exponent();

	const unsigned gap = unsigned(divisor.exponent() - dividend.exponent());

	// The scaled divisor exceeds the dividend
	if(gap > unsigned(WideShiftLimit))
		return left;

	return left % (right * pow10Wide(gap));
}



//-STATIC-ARITHMETIC-HELPER-METHODS------------------------------------------------------------------------------------

huge_number huge_number::Add(const huge_number &left, const huge_number &right)
{
	huge_number result;

	if(checkAdd(result, left, right)) {
		const bool leftIsUpper = left.m_exponent >= right.m_exponent;

		const huge_number
				&upper = leftIsUpper ? left : right,
				&lower = leftIsUpper ? right : left;

		const int gap = int(upper.m_exponent) - int(lower.m_exponent);

		// The lower operand lies below the last significant digit of the upper one
		if(gap > WideShiftLimit)
			return upper;

		const wide_int_t denominator = wide_int_t(left.m_denominator) * right.m_denominator
									   / GreatestCommonFactor(left.m_denominator, right.m_denominator);

		const wide_int_t
				upperNumerator = wide_int_t(upper.m_mantissa) * (denominator / upper.m_denominator) * pow10Wide(unsigned(gap)),
				lowerNumerator = wide_int_t(lower.m_mantissa) * (denominator / lower.m_denominator);

		result = fromWideRatio(upperNumerator + lowerNumerator, denominator, lower.m_exponent);
	}

	return result;
}

huge_number huge_number::Subtract(const huge_number &left, const huge_number &right)
{
	return Add(left, Negate(right));
}

huge_number huge_number::Multiply(const huge_number &left, const huge_number &right)
{
	huge_number result;

	if(checkMultiply(result, left, right)) {
		const int exponent = int(left.m_exponent) + int(right.m_exponent);

		// Decimals with fractional digits may already carry rounding, keep the product decimal
		const bool decimal = (left.m_denominator == DefaultDenominator && left.m_exponent < 0)
							 || (right.m_denominator == DefaultDenominator && right.m_exponent < 0);

		if(decimal) {
			const huge_number
					leftDecimal = ToDecimal(left),
					rightDecimal = ToDecimal(right);

			if(TRACE_ARITHMETIC) BOOST_LOG_TRIVIAL(trace) << "Multiply decimal " << leftDecimal << " * " << rightDecimal;

			result = fromWideInt(wide_int_t(leftDecimal.m_mantissa) * rightDecimal.m_mantissa,
								 int(leftDecimal.m_exponent) + int(rightDecimal.m_exponent));
		}
		else
			result = fromWideRatio(wide_int_t(left.m_mantissa) * right.m_mantissa,
								   wide_int_t(left.m_denominator) * right.m_denominator,
								   exponent);
	}

	return result;
}

huge_number huge_number::Divide(const huge_number &dividend, const huge_number &divisor)
{
	huge_number result;

	if(checkDivide(result, dividend, divisor)) {
		const int exponent = int(dividend.m_exponent) - int(divisor.m_exponent);

		const bool decimal = (dividend.m_denominator == DefaultDenominator && dividend.m_exponent < 0)
							 || (divisor.m_denominator == DefaultDenominator && divisor.m_exponent < 0);

		if(decimal) {
			const huge_number
					dividendDecimal = ToDecimal(dividend),
					divisorDecimal = ToDecimal(divisor);

			if(TRACE_ARITHMETIC) BOOST_LOG_TRIVIAL(trace) << "Divide decimal " << dividendDecimal << " / " << divisorDecimal;

			result = fromWideFloat(wide_float_t(dividendDecimal.m_mantissa) / wide_float_t(divisorDecimal.m_mantissa),
								   int(dividendDecimal.m_exponent) - int(divisorDecimal.m_exponent));
		}
		else {
			// (a / da) / (b / db) = (a * db) / (da * b)
			const wide_int_t
					numerator = wide_int_t(dividend.m_mantissa) * divisor.m_denominator * divisor.sign(),
					denominator = wide_int_t(dividend.m_denominator) * mp::abs(wide_int_t(divisor.m_mantissa));

			result = fromWideRatio(numerator, denominator, exponent);
		}
	}

	return result;
}

huge_number huge_number::Mod(const huge_number &dividend, const huge_number &divisor)
{
	huge_number result;

	if(checkMod(result, dividend, divisor)) {
		int exponent = 0;
		wide_int_t denominator;

		const wide_int_t magnitude = remainder(dividend, divisor, 1, exponent, denominator);

		result = fromWideRatio(dividend.m_mantissa < 0 ? wide_int_t(-magnitude) : magnitude, denominator, exponent);
	}

	return result;
}

std::pair<huge_number, huge_number> huge_number::DivRem(const huge_number &dividend, const huge_number &divisor)
{
	const huge_number quotient = Floor(Divide(dividend, divisor));

	return {quotient, Subtract(dividend, Multiply(divisor, quotient))};
}

huge_number huge_number::IEEERemainder(const huge_number &x, const huge_number &y)
{
	huge_number result;

	if(checkRemainder(result, x, y)) {
		// x lies far below half of y
		if(int(y.m_exponent) - int(x.m_exponent) > WideShiftLimit)
			return x;

		int exponent = 0;
		wide_int_t denominator;

		// Remainder modulo twice the divisor also gives the parity of the truncated quotient
		const wide_int_t
				doubled = remainder(x, y, 2, exponent, denominator),
				divisor = mp::abs(wide_int_t(y.m_mantissa)) * (denominator / y.m_denominator)
						  * (exponent < y.m_exponent ? pow10Wide(unsigned(y.m_exponent - exponent)) : wide_int_t(1));

		const bool odd = doubled >= divisor;
		const wide_int_t truncated = odd ? wide_int_t(doubled - divisor) : doubled;
		const int half = (truncated * 2 > divisor) - (truncated * 2 < divisor);

		// Round the quotient half to even
		wide_int_t magnitude = truncated;

		if(half > 0 || (half == 0 && odd))
			magnitude -= divisor;

		if(magnitude == 0)
			return signedZero(x.isNegative());

		result = fromWideRatio(x.m_mantissa < 0 ? wide_int_t(-magnitude) : magnitude, denominator, exponent);
	}

	return result;
}

huge_number huge_number::Square(const huge_number &value)
{
	if(value.isNaN() || value.isZero() || value.isPositiveInfinity())
		return value;
	if(value.isNegativeInfinity())
		return PositiveInfinity();

	return Multiply(value, value);
}

huge_number huge_number::Cube(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity() || value.isZero())
		return value;

	return Multiply(Multiply(value, value), value);
}

huge_number huge_number::FusedMultiplyAdd(const huge_number &x, const huge_number &y, const huge_number &z)
{
	return Add(Multiply(x, y), z);
}

huge_number huge_number::ScaleB(const huge_number &value, int n)
{
	if(!value.isFinite() || value.isZero())
		return value;

	// Any shift past the full exponent span overflows or underflows every finite value
	static constexpr int MaxShift = 2 * int(MaxExponent) + int(MantissaSignificantDigits);

	const int shift = std::max(-MaxShift, std::min(n, MaxShift));

	return huge_number(value.m_mantissa, value.m_denominator, int(value.m_exponent) + shift);
}

huge_number huge_number::Reciprocal(const huge_number &value)
{
	if(value.isNaN() || value.isZero())
		return NaN();
	if(value.isInfinity())
		return value.isNegative() ? NegativeZero() : Zero();

	const umantissa_t magnitude = Magnitude(value.m_mantissa);

	// Numerator and denominator swap places while the mantissa fits a denominator
	if(magnitude <= MaxDenominator && (value.isRational() || value.m_exponent >= 0))
		return huge_number(mantissa_t(value.m_denominator) * value.sign(), denominator_t(magnitude), -int(value.m_exponent));

	return Divide(One(), value);
}



//-SIGN-HELPER-METHODS-------------------------------------------------------------------------------------------------

huge_number huge_number::Negate(const huge_number &value)
{
	if(value.isNaN())
		return value;
	if(value.isZero())
		return value.isNegativeZero() ? Zero() : NegativeZero();

	return huge_number(-value.m_mantissa, value.m_exponent, value.m_denominator, RawFields{});
}

huge_number huge_number::Abs(const huge_number &value)
{
	return value.isNegative() ? Negate(value) : value;
}

huge_number huge_number::CopySign(const huge_number &value, const huge_number &sign)
{
	if(value.isNaN() || sign.isNaN())
		return NaN();

	return value.isNegative() != sign.isNegative() ? Negate(value) : value;
}



//-EPSILON-HELPER-METHODS----------------------------------------------------------------------------------------------

huge_number huge_number::GetEpsilon(const huge_number &value)
{
	if(value.isNaN())
		return NaN();
	if(value.isZero())
		return Epsilon();
	if(value.isInfinity())
		return PositiveInfinity();

	// One unit in the last place of a full-width mantissa
	const int digits = value.mantissaDigits();

	return huge_number(1, int(value.m_exponent) - (MantissaSignificantDigits - digits));
}

huge_number huge_number::Increment(const huge_number &value)
{
	return value.isNegativeInfinity() ? MinValue() : Add(value, Max(One(), GetEpsilon(value)));
}

huge_number huge_number::Decrement(const huge_number &value)
{
	return value.isPositiveInfinity() ? MaxValue() : Subtract(value, Max(One(), GetEpsilon(value)));
}

huge_number huge_number::BitIncrement(const huge_number &value)
{
	return value.isNegativeInfinity() ? MinValue() : Add(value, GetEpsilon(value));
}

huge_number huge_number::BitDecrement(const huge_number &value)
{
	return value.isPositiveInfinity() ? MaxValue() : Subtract(value, GetEpsilon(value));
}



//-INTERPOLATION-HELPER-METHODS----------------------------------------------------------------------------------------

huge_number huge_number::Lerp(const huge_number &first, const huge_number &second, const huge_number &amount)
{
	return Add(first, Multiply(Subtract(second, first), amount));
}

huge_number huge_number::InverseLerp(const huge_number &first, const huge_number &second, const huge_number &result)
{
	const huge_number difference = Subtract(second, first);

	if(difference.isZero())
		return Equal(result, first) ? huge_number(5, -1) : NaN();

	return Divide(Subtract(result, first), difference);
}

huge_number huge_number::SnapTo(const huge_number &value, const huge_number &target)
{
	return value.isNearlyEqualTo(target) ? target : value;
}

huge_number huge_number::SnapToZero(const huge_number &value)
{
	return value.isNearlyZero() ? Zero() : value;
}



//-GLOBAL-OPERATOR-OVERLOADS-------------------------------------------------------------------------------------------

huge_number operator+(const huge_number &left, const huge_number &right)
{
	return huge_number::Add(left, right);
}

huge_number operator-(const huge_number &left, const huge_number &right)
{
	return huge_number::Subtract(left, right);
}

huge_number operator*(const huge_number &left, const huge_number &right)
{
	return huge_number::Multiply(left, right);
}

huge_number operator/(const huge_number &left, const huge_number &right)
{
	return huge_number::Divide(left, right);
}

huge_number operator%(const huge_number &left, const huge_number &right)
{
	return huge_number::Mod(left, right);
}
