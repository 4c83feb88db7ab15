#include "huge_number.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>
#include <boost/math/constants/constants.hpp>

//#define TRACE_TRIGONOMETRY	1

#ifndef TRACE_TRIGONOMETRY
#define TRACE_TRIGONOMETRY	0 // don't test
#endif



//-CONSTANT-DEFINITIONS------------------------------------------------------------------------------------------------

namespace constants = boost::math::constants;

// Largest leading digit exponent with enough wide digits left to reduce by 2 pi
static constexpr int PeriodicExponentLimit = 40;

// |x| past which the hyperbolic functions have left the exponent range
static constexpr int HyperbolicLimit = 75500;



//-WIDE-HELPERS--------------------------------------------------------------------------------------------------------

static inline huge_number signedValue(bool negative, const wide_float_t &magnitude)
{
	return fromWideFloat(negative ? wide_float_t(-magnitude) : magnitude);
}

static bool belowSeriesThreshold(const huge_number &value)
{
	return huge_number::Less(huge_number::Abs(value), huge_number(1, -20));
}

// Whether the wide type still holds the fractional digits of a periodic argument
static bool isPeriodicallyReducible(const huge_number &value)
{
	const int adjusted = int(value.exponent()) + int(value.mantissaDigits()) - 1;

	if(TRACE_TRIGONOMETRY && adjusted > PeriodicExponentLimit)
		BOOST_LOG_TRIVIAL(trace) << "periodic argument " << value << " beyond the wide precision";

	return adjusted <= PeriodicExponentLimit;
}

// |value| reduced exactly into [0, 2) half turns
static huge_number halfTurns(const huge_number &value)
{
	return huge_number::Mod(huge_number::Abs(value), 2);
}

// Quarter turn index of an angle lying on an axis, -1 for any other angle
static int axisQuadrant(const huge_number &turns)
{
	if(!huge_number::Mod(turns, huge_number(1, 2, 0)).isZero())
		return -1;

	return int(huge_number::RoundToInt64(huge_number::Multiply(turns, 2)));
}

static inline wide_float_t toRadians(const huge_number &turns)
{
	return constants::pi<wide_float_t>() * toWideFloat(turns);
}

static inline huge_number toHalfTurns(const wide_float_t &radians)
{
	return fromWideFloat(radians / constants::pi<wide_float_t>());
}



//-TRIGONOMETRY-PRELIMINARY-CHECKS-------------------------------------------------------------------------------------
//    These functions are run before the actual computation to do bound checking, and return true if they pass
//    If they return false, they MUST set the result and that value will be returned

static bool checkPeriodic(huge_number &result, const huge_number &value)
{
	if(value.isNaN() || value.isInfinity() || !isPeriodicallyReducible(value))
		result = huge_number::NaN();
	else
		return true;
	return false;
}

static bool checkInverseSine(huge_number &result, const huge_number &value)
{
	if(value.isNaN() || huge_number::More(huge_number::Abs(value), huge_number::One()))
		result = huge_number::NaN();
	else
		return true;
	return false;
}

static bool checkAtan2(huge_number &result, const huge_number &y, const huge_number &x)
{
	const bool
			yNegative = y.isNegative(),
			xNegative = x.isNegative(),
			yZero = y.isZero(),
			xZero = x.isZero(),
			yInfinity = y.isInfinity(),
			xInfinity = x.isInfinity();

	const wide_float_t pi = constants::pi<wide_float_t>();

	if(y.isNaN() | x.isNaN())
		result = huge_number::NaN();
	else if(yZero)
		result = xNegative ? signedValue(yNegative, pi) : y;
	else if(xZero)
		result = signedValue(yNegative, constants::half_pi<wide_float_t>());
	else if(yInfinity & xInfinity)
		result = signedValue(yNegative, xNegative ? constants::three_quarters_pi<wide_float_t>() : constants::quarter_pi<wide_float_t>());
	else if(yInfinity)
		result = signedValue(yNegative, constants::half_pi<wide_float_t>());
	else if(xInfinity)
		result = xNegative ? signedValue(yNegative, pi) : (yNegative ? huge_number::NegativeZero() : huge_number::Zero());
	else
		return true;
	return false;
}

static bool checkAtan2Pi(huge_number &result, const huge_number &y, const huge_number &x)
{
	const bool
			yNegative = y.isNegative(),
			xNegative = x.isNegative(),
			yZero = y.isZero(),
			xZero = x.isZero(),
			yInfinity = y.isInfinity(),
			xInfinity = x.isInfinity();

	const huge_number
			half(1, 2, 0),
			quarter(1, 4, 0),
			threeQuarters(3, 4, 0);

	if(y.isNaN() | x.isNaN())
		result = huge_number::NaN();
	else if(yZero)
		result = xNegative ? huge_number::CopySign(huge_number::One(), y) : y;
	else if(xZero)
		result = huge_number::CopySign(half, y);
	else if(yInfinity & xInfinity)
		result = huge_number::CopySign(xNegative ? threeQuarters : quarter, y);
	else if(yInfinity)
		result = huge_number::CopySign(half, y);
	else if(xInfinity)
		result = xNegative ? huge_number::CopySign(huge_number::One(), y) : (yNegative ? huge_number::NegativeZero() : huge_number::Zero());
	else
		return true;
	return false;
}



//-CIRCULAR-FUNCTIONS--------------------------------------------------------------------------------------------------

huge_number huge_number::Sin(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return value;

	if(checkPeriodic(result, value))
		result = fromWideFloat(mp::sin(toWideFloat(value)));

	return result;
}

huge_number huge_number::Cos(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return One();

	if(checkPeriodic(result, value))
		result = fromWideFloat(mp::cos(toWideFloat(value)));

	return result;
}

huge_number huge_number::Tan(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return value;

	if(checkPeriodic(result, value))
		result = fromWideFloat(mp::tan(toWideFloat(value)));

	return result;
}

huge_number huge_number::Asin(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return value;

	if(checkInverseSine(result, value))
		result = fromWideFloat(mp::asin(toWideFloat(value)));

	return result;
}

huge_number huge_number::Acos(const huge_number &value)
{
	huge_number result;

	if(Equal(value, One()))
		return Zero();

	if(checkInverseSine(result, value))
		result = fromWideFloat(mp::acos(toWideFloat(value)));

	return result;
}

huge_number huge_number::Atan(const huge_number &value)
{
	if(value.isNaN() || value.isZero())
		return value;
	if(value.isInfinity())
		return signedValue(value.isNegative(), constants::half_pi<wide_float_t>());

	return fromWideFloat(mp::atan(toWideFloat(value)));
}

huge_number huge_number::Atan2(const huge_number &y, const huge_number &x)
{
	huge_number result;

	if(checkAtan2(result, y, x))
		result = fromWideFloat(mp::atan2(toWideFloat(y), toWideFloat(x)));

	return result;
}

std::pair<huge_number, huge_number> huge_number::SinCos(const huge_number &value)
{
	return {Sin(value), Cos(value)};
}



//-HALF-TURN-FUNCTIONS-------------------------------------------------------------------------------------------------
//    Arguments are reduced modulo 2 exactly, angles on an axis give exact results

huge_number huge_number::SinPi(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity())
		return NaN();
	if(value.isZero())
		return value;

	const huge_number turns = halfTurns(value);
	const huge_number onAxis[] = {Zero(), One(), Zero(), NegativeOne()};
	const int quadrant = axisQuadrant(turns);

	const huge_number result = quadrant < 0 ? fromWideFloat(mp::sin(toRadians(turns))) : onAxis[quadrant];

	return value.isNegative() ? Negate(result) : result;
}

huge_number huge_number::CosPi(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity())
		return NaN();
	if(value.isZero())
		return One();

	const huge_number turns = halfTurns(value);
	const huge_number onAxis[] = {One(), Zero(), NegativeOne(), Zero()};
	const int quadrant = axisQuadrant(turns);

	return quadrant < 0 ? fromWideFloat(mp::cos(toRadians(turns))) : onAxis[quadrant];
}

huge_number huge_number::TanPi(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity())
		return NaN();
	if(value.isZero())
		return value;

	const huge_number turns = halfTurns(value);
	const huge_number onAxis[] = {Zero(), PositiveInfinity(), NegativeZero(), NegativeInfinity()};
	const int quadrant = axisQuadrant(turns);

	const huge_number result = quadrant < 0 ? fromWideFloat(mp::tan(toRadians(turns))) : onAxis[quadrant];

	return value.isNegative() ? Negate(result) : result;
}

std::pair<huge_number, huge_number> huge_number::SinCosPi(const huge_number &value)
{
	return {SinPi(value), CosPi(value)};
}

huge_number huge_number::AsinPi(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return value;

	if(checkInverseSine(result, value)) {
		if(Equal(Abs(value), One()))
			result = CopySign(huge_number(1, 2, 0), value);
		else
			result = toHalfTurns(mp::asin(toWideFloat(value)));
	}

	return result;
}

huge_number huge_number::AcosPi(const huge_number &value)
{
	huge_number result;

	if(value.isZero())
		return huge_number(1, 2, 0);
	if(Equal(value, One()))
		return Zero();
	if(Equal(value, NegativeOne()))
		return One();

	if(checkInverseSine(result, value))
		result = toHalfTurns(mp::acos(toWideFloat(value)));

	return result;
}

huge_number huge_number::AtanPi(const huge_number &value)
{
	if(value.isNaN() || value.isZero())
		return value;
	if(value.isInfinity())
		return CopySign(huge_number(1, 2, 0), value);
	if(Equal(Abs(value), One()))
		return CopySign(huge_number(1, 4, 0), value);

	return toHalfTurns(mp::atan(toWideFloat(value)));
}

huge_number huge_number::Atan2Pi(const huge_number &y, const huge_number &x)
{
	huge_number result;

	if(checkAtan2Pi(result, y, x))
		result = toHalfTurns(mp::atan2(toWideFloat(y), toWideFloat(x)));

	return result;
}



//-HYPERBOLIC-FUNCTIONS------------------------------------------------------------------------------------------------

huge_number huge_number::Sinh(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity() || value.isZero())
		return value;
	if(More(Abs(value), HyperbolicLimit))
		return value.isNegative() ? NegativeInfinity() : PositiveInfinity();

	return fromWideFloat(mp::sinh(toWideFloat(value)));
}

huge_number huge_number::Cosh(const huge_number &value)
{
	if(value.isNaN())
		return value;
	if(value.isZero())
		return One();
	if(value.isInfinity() || More(Abs(value), HyperbolicLimit))
		return PositiveInfinity();

	return fromWideFloat(mp::cosh(toWideFloat(value)));
}

huge_number huge_number::Tanh(const huge_number &value)
{
	if(value.isNaN() || value.isZero())
		return value;
	if(value.isInfinity() || More(Abs(value), HyperbolicLimit))
		return value.isNegative() ? NegativeOne() : One();

	return fromWideFloat(mp::tanh(toWideFloat(value)));
}

// asinh x = ln(|x| + sqrt(x^2 + 1)), odd
huge_number huge_number::Asinh(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity() || value.isZero() || belowSeriesThreshold(value))
		return value;

	const wide_float_t magnitude = mp::abs(toWideFloat(value));

	return signedValue(value.isNegative(), mp::log(magnitude + mp::sqrt(magnitude * magnitude + 1)));
}

// acosh x = ln(x + sqrt(x^2 - 1)), x >= 1
huge_number huge_number::Acosh(const huge_number &value)
{
	if(value.isNaN() || Less(value, One()))
		return NaN();
	if(value.isPositiveInfinity())
		return value;
	if(Equal(value, One()))
		return Zero();

	const wide_float_t wide = toWideFloat(value);

	return fromWideFloat(mp::log(wide + mp::sqrt(wide * wide - 1)));
}

// atanh x = ln((1 + x) / (1 - x)) / 2, |x| < 1
huge_number huge_number::Atanh(const huge_number &value)
{
	if(value.isNaN() || More(Abs(value), One()))
		return NaN();
	if(Equal(value, One()))
		return PositiveInfinity();
	if(Equal(value, NegativeOne()))
		return NegativeInfinity();
	if(value.isZero() || belowSeriesThreshold(value))
		return value;

	const wide_float_t wide = toWideFloat(value);

	return fromWideFloat(mp::log((1 + wide) / (1 - wide)) / 2);
}
