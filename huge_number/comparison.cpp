#include "huge_number.hpp"
#include "wide.hpp"



//-COMPARISON-PRELIMINARY-CHECKS---------------------------------------------------------------------------------------
//    These functions are run before the digit comparison, and return true if it is still needed
//    If they return false, they MUST set the result

// Position of a value among -Infinity, the finite values and +Infinity
static int infinityRank(const huge_number &value) noexcept
{
	return value.isPositiveInfinity() - value.isNegativeInfinity();
}

static bool checkCompare(int &result, const huge_number &left, const huge_number &right)
{
	const bool
			leftNan = left.isNaN(),
			rightNan = right.isNaN(),
			leftInfinity = left.isInfinity(),
			rightInfinity = right.isInfinity(),
			leftZero = left.isZero(),
			rightZero = right.isZero(),
			leftNegative = left.isNegative(),
			rightNegative = right.isNegative();

	if(leftNan | rightNan)
		result = int(rightNan) - int(leftNan);
	else if(leftInfinity | rightInfinity)
		result = infinityRank(left) - infinityRank(right);
	else if(leftZero & rightZero)
		result = int(rightNegative) - int(leftNegative);
	else if(leftZero)
		result = rightNegative ? 1 : -1;
	else if(rightZero)
		result = leftNegative ? -1 : 1;
	else if(leftNegative != rightNegative)
		result = leftNegative ? -1 : 1;
	else
		return true;
	return false;
}



//-MAGNITUDE-COMPARISON------------------------------------------------------------------------------------------------

// Compares left * 10^leftExponent with right * 10^rightExponent for positive integers
static int compareMagnitudes(const wide_int_t &left, int leftExponent, const wide_int_t &right, int rightExponent)
{
	// Exponent of the leading digit
	const int
			leftAdjusted = leftExponent + int(wideDigits(left)) - 1,
			rightAdjusted = rightExponent + int(wideDigits(right)) - 1;

	if(leftAdjusted != rightAdjusted)
		return leftAdjusted < rightAdjusted ? -1 : 1;

	// Equal leading digit positions keep the exponent gap within the digit count
	const wide_int_t
			leftAligned = leftExponent > rightExponent ? left * pow10Wide(unsigned(leftExponent - rightExponent)) : left,
			rightAligned = rightExponent > leftExponent ? right * pow10Wide(unsigned(rightExponent - leftExponent)) : right;

	return (leftAligned > rightAligned) - (leftAligned < rightAligned);
}



//-STATIC-COMPARISON-HELPER-METHODS------------------------------------------------------------------------------------

int huge_number::CompareTo(const huge_number &left, const huge_number &right)
{
	int result = 0;

	if(checkCompare(result, left, right)) {
		// Cross multiplying puts both sides over the same denominator
		const wide_int_t
				leftMagnitude = mp::abs(wide_int_t(left.m_mantissa)) * right.m_denominator,
				rightMagnitude = mp::abs(wide_int_t(right.m_mantissa)) * left.m_denominator;

		result = compareMagnitudes(leftMagnitude, left.m_exponent, rightMagnitude, right.m_exponent);

		if(left.m_mantissa < 0)
			result = -result;
	}

	return result;
}

bool huge_number::Equal(const huge_number &left, const huge_number &right)
{
	if(left.isNaN() | right.isNaN())
		return false;

	return left.m_mantissa == right.m_mantissa
		   && left.m_exponent == right.m_exponent
		   && left.m_denominator == right.m_denominator;
}

bool huge_number::NotEqual(const huge_number &left, const huge_number &right)
{
	return !Equal(left, right);
}

bool huge_number::Less(const huge_number &left, const huge_number &right)
{
	return CompareTo(left, right) < 0;
}

bool huge_number::LessEqual(const huge_number &left, const huge_number &right)
{
	return CompareTo(left, right) <= 0;
}

bool huge_number::More(const huge_number &left, const huge_number &right)
{
	return CompareTo(left, right) > 0;
}

bool huge_number::MoreEqual(const huge_number &left, const huge_number &right)
{
	return CompareTo(left, right) >= 0;
}

huge_number huge_number::Min(const huge_number &left, const huge_number &right)
{
	if(left.isNaN() | right.isNaN())
		return NaN();

	return LessEqual(left, right) ? left : right;
}

huge_number huge_number::Max(const huge_number &left, const huge_number &right)
{
	if(left.isNaN() | right.isNaN())
		return NaN();

	return MoreEqual(left, right) ? left : right;
}

huge_number huge_number::Clamp(const huge_number &value, const huge_number &min, const huge_number &max)
{
	if(value.isNaN() | More(min, max))
		return NaN();

	return Min(Max(value, min), max);
}

// Equal magnitudes prefer the positive operand
huge_number huge_number::MaxMagnitude(const huge_number &left, const huge_number &right)
{
	if(left.isNaN() | right.isNaN())
		return NaN();

	const int order = CompareTo(Abs(left), Abs(right));

	return order > 0 || (order == 0 && right.isNegative()) ? left : right;
}

// Equal magnitudes prefer the negative operand
huge_number huge_number::MinMagnitude(const huge_number &left, const huge_number &right)
{
	if(left.isNaN() | right.isNaN())
		return NaN();

	const int order = CompareTo(Abs(left), Abs(right));

	return order < 0 || (order == 0 && left.isNegative()) ? left : right;
}

huge_number huge_number::MaxMagnitudeNumber(const huge_number &left, const huge_number &right)
{
	if(left.isNaN())
		return right;
	if(right.isNaN())
		return left;

	return MaxMagnitude(left, right);
}

huge_number huge_number::MinMagnitudeNumber(const huge_number &left, const huge_number &right)
{
	if(left.isNaN())
		return right;
	if(right.isNaN())
		return left;

	return MinMagnitude(left, right);
}



//-GLOBAL-OPERATOR-OVERLOADS-------------------------------------------------------------------------------------------

bool operator==(const huge_number &left, const huge_number &right)
{
	return huge_number::Equal(left, right);
}

bool operator!=(const huge_number &left, const huge_number &right)
{
	return huge_number::NotEqual(left, right);
}

bool operator<(const huge_number &left, const huge_number &right)
{
	return huge_number::Less(left, right);
}

bool operator<=(const huge_number &left, const huge_number &right)
{
	return huge_number::LessEqual(left, right);
}

bool operator>(const huge_number &left, const huge_number &right)
{
	return huge_number::More(left, right);
}

bool operator>=(const huge_number &left, const huge_number &right)
{
	return huge_number::MoreEqual(left, right);
}
