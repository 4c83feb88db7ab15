#include "huge_number.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>
#include <boost/math/constants/constants.hpp>

//#define TRACE_TRANSCENDENTAL	1

#ifndef TRACE_TRANSCENDENTAL
#define TRACE_TRANSCENDENTAL	0 // don't test
#endif



//-CONSTANT-DEFINITIONS------------------------------------------------------------------------------------------------

namespace constants = boost::math::constants;

// Safety valve for the series below
static constexpr int SeriesIterationLimit = 100000;

// |ln| beyond which the result leaves the exponent range
static constexpr int ExpLimit = 75500;

// |x| beyond which 10^x leaves the exponent range
static constexpr int Exp10Limit = 40000;



//-SERIES--------------------------------------------------------------------------------------------------------------

// Natural logarithm of a finite positive value
static wide_float_t logSeries(const huge_number &value)
{
	const huge_number decimal = huge_number::ToDecimal(value);

	std::string digits = std::to_string(decimal.mantissa());
	const int magnitude = int(decimal.exponent()) + int(digits.size()) - 1;

	// z = mantissa scaled into [1, 10)
	if(digits.size() > 1)
		digits.insert(1, ".");

	const wide_float_t
			z(digits.c_str()),
			ratio = (z - 1) / (z + 1),
			ratioSquared = ratio * ratio;

	wide_float_t sum = 0, power = ratio;
	int k = 0;

	for(; k < SeriesIterationLimit; ++k) {
		const wide_float_t next = sum + power / (2 * k + 1);

		if(next == sum)
			break;

		sum = next;
		power *= ratioSquared;
	}

	if(k == SeriesIterationLimit)
		BOOST_LOG_TRIVIAL(warning) << "Log series of " << value << " stopped at " << SeriesIterationLimit << " iterations";

	if(TRACE_TRANSCENDENTAL) BOOST_LOG_TRIVIAL(trace) << "logSeries " << value << " iterations " << k;

	return 2 * sum + magnitude * constants::ln_ten<wide_float_t>();
}

// e^x for |x| within ExpLimit
static wide_float_t expWide(const wide_float_t &x)
{
	const wide_float_t
			whole = mp::floor(x),
			fraction = x - whole;

	long long n = whole.convert_to<long long>();
	const bool inverse = n < 0;

	if(inverse)
		n = -n;

	// e^n by repeated squaring
	wide_float_t result = 1, power = constants::e<wide_float_t>();

	for(; n; n >>= 1) {
		if(n & 1)
			result *= power;

		power *= power;
	}

	if(inverse)
		result = 1 / result;

	// e^fraction by the Taylor series, fraction in [0, 1)
	wide_float_t sum = 1, term = 1;
	int k = 1;

	for(; k < SeriesIterationLimit; ++k) {
		term *= fraction / k;

		const wide_float_t next = sum + term;

		if(next == sum)
			break;

		sum = next;
	}

	if(k == SeriesIterationLimit)
		BOOST_LOG_TRIVIAL(warning) << "Exp series stopped at " << SeriesIterationLimit << " iterations";

	return result * sum;
}

static huge_number expGuarded(const wide_float_t &x)
{
	if(x > ExpLimit)
		return huge_number::PositiveInfinity();
	if(x < -ExpLimit)
		return huge_number::Zero();

	return fromWideFloat(expWide(x));
}

// value^exponent by binary exponentiation
static huge_number power(const huge_number &value, uint64_t exponent)
{
	// The current square and the result are updated for every bit of the exponent
	huge_number
			result = huge_number::One(),
			current = value;

	for(;;) {
		if(exponent & 1)
			result = huge_number::Multiply(result, current);

		exponent >>= 1;

		if(!exponent)
			break;

		current = huge_number::Square(current);
	}

	return result;
}



//-TRANSCENDENTAL-PRELIMINARY-CHECKS-----------------------------------------------------------------------------------
//    These functions are run before the actual computation to do bound checking, and return true if they pass
//    If they return false, they MUST set the result and that value will be returned

static bool checkLog(huge_number &result, const huge_number &value)
{
	const bool
			nan = value.isNaN(),
			zero = value.isZero(),
			infinity = value.isPositiveInfinity();

	if(zero | infinity)
		result = huge_number::PositiveInfinity();
	else if(nan | value.isNegative())
		result = huge_number::NaN();
	else
		return true;
	return false;
}

static bool checkLogBase(huge_number &result, const huge_number &value, const huge_number &base)
{
	const bool
			valueNan = value.isNaN(),
			baseNan = base.isNaN(),
			valueOne = huge_number::Equal(value, huge_number::One()),
			baseOne = huge_number::Equal(base, huge_number::One()),
			degenerateBase = base.isZero() | base.isInfinity(),
			valueNegative = value.sign() < 0,
			baseNegative = base.sign() < 0;

	if(valueNan | baseNan | baseOne | valueNegative | (!valueOne & degenerateBase))
		result = huge_number::NaN();
	else if(value.isZero() | value.isPositiveInfinity())
		result = huge_number::PositiveInfinity();
	// The logarithm of a negative base is NaN, so is the quotient
	else if(baseNegative)
		result = huge_number::NaN();
	else if(valueOne)
		result = huge_number::Zero();
	else
		return true;
	return false;
}

static bool checkExp(huge_number &result, const huge_number &value)
{
	if(value.isNaN() | value.isPositiveInfinity())
		result = value;
	else if(value.isNegativeInfinity())
		result = huge_number::Zero();
	else if(value.isZero())
		result = huge_number::One();
	else
		return true;
	return false;
}

static bool checkPow(huge_number &result, const huge_number &x, const huge_number &y)
{
	const bool
			xNan = x.isNaN(),
			yNan = y.isNaN(),
			xOne = huge_number::Equal(x, huge_number::One()),
			yOne = huge_number::Equal(y, huge_number::One()),
			yNegative = y.isNegative(),
			yInteger = y.isInteger();

	if(xNan | yNan)
		result = huge_number::NaN();
	else if(y.isZero())
		result = huge_number::One();
	else if(x.isZero())
		result = yNegative ? huge_number::PositiveInfinity() : huge_number::Zero();
	else if(xOne | yOne)
		result = x;
	else if(x.isPositiveInfinity())
		result = yNegative ? huge_number::Zero() : huge_number::PositiveInfinity();
	else if(x.isNegativeInfinity()) {
		if(y.isOddInteger())
			result = yNegative ? huge_number::NegativeZero() : huge_number::NegativeInfinity();
		else
			result = yNegative ? huge_number::Zero() : huge_number::PositiveInfinity();
	}
	else if(y.isInfinity()) {
		const int magnitude = huge_number::CompareTo(huge_number::Abs(x), huge_number::One());

		if(!magnitude)
			result = huge_number::One();
		else
			result = (magnitude > 0) != yNegative ? huge_number::PositiveInfinity() : huge_number::Zero();
	}
	else if(x.isNegative() & !yInteger)
		result = huge_number::NaN();
	else if(huge_number::Equal(x, huge_number::NegativeOne()))
		result = y.isOddInteger() ? huge_number::NegativeOne() : huge_number::One();
	else
		return true;
	return false;
}

static bool checkSqrt(huge_number &result, const huge_number &value)
{
	const bool
			nan = value.isNaN(),
			zero = value.isZero(),
			one = huge_number::Equal(value, huge_number::One());

	if(zero | one | value.isPositiveInfinity())
		result = value;
	else if(nan | value.isNegative())
		result = huge_number::NaN();
	else
		return true;
	return false;
}

static bool checkRootN(huge_number &result, const huge_number &value, int n)
{
	const bool
			odd = n % 2 != 0,
			negative = value.isNegative();

	if(value.isNaN() | !n)
		result = huge_number::NaN();
	else if(value.isZero()) {
		if(n < 0)
			result = odd && negative ? huge_number::NegativeInfinity() : huge_number::PositiveInfinity();
		else
			result = odd ? value : huge_number::Zero();
	}
	else if(value.isPositiveInfinity())
		result = n > 0 ? value : huge_number::Zero();
	else if(value.isNegativeInfinity()) {
		if(!odd)
			result = huge_number::NaN();
		else
			result = n > 0 ? value : huge_number::NegativeZero();
	}
	else if(negative & !odd)
		result = huge_number::NaN();
	else if(n == 1)
		result = value;
	else
		return true;
	return false;
}



//-LOGARITHMS----------------------------------------------------------------------------------------------------------

huge_number huge_number::Log(const huge_number &value)
{
	huge_number result;

	if(checkLog(result, value))
		result = fromWideFloat(logSeries(value));

	return result;
}

huge_number huge_number::Log(const huge_number &value, const huge_number &base)
{
	huge_number result;

	if(checkLogBase(result, value, base))
		result = fromWideFloat(logSeries(value) / logSeries(base));

	return result;
}

huge_number huge_number::Log2(const huge_number &value)
{
	huge_number result;

	if(checkLog(result, value))
		result = fromWideFloat(logSeries(value) / constants::ln_two<wide_float_t>());

	return result;
}

huge_number huge_number::Log10(const huge_number &value)
{
	huge_number result;

	if(checkLog(result, value))
		result = fromWideFloat(logSeries(value) / constants::ln_ten<wide_float_t>());

	return result;
}

huge_number huge_number::LogP1(const huge_number &value)
{
	return Log(Add(value, One()));
}

huge_number huge_number::Log2P1(const huge_number &value)
{
	return Log2(Add(value, One()));
}

huge_number huge_number::Log10P1(const huge_number &value)
{
	return Log10(Add(value, One()));
}



//-EXPONENTIALS--------------------------------------------------------------------------------------------------------

huge_number huge_number::Exp(const huge_number &value)
{
	huge_number result;

	if(checkExp(result, value))
		result = expGuarded(toWideFloat(value));

	return result;
}

huge_number huge_number::Exp2(const huge_number &value)
{
	return Pow(2, value);
}

huge_number huge_number::Exp10(const huge_number &value)
{
	if(!value.isInteger())
		return Pow(10, value);

	// Whole powers of ten are a plain exponent
	if(More(value, Exp10Limit))
		return PositiveInfinity();
	if(Less(value, -Exp10Limit))
		return Zero();

	return huge_number(1, int(value.toInt64()));
}

huge_number huge_number::ExpM1(const huge_number &value)
{
	return Subtract(Exp(value), One());
}

huge_number huge_number::Exp2M1(const huge_number &value)
{
	return Subtract(Exp2(value), One());
}

huge_number huge_number::Exp10M1(const huge_number &value)
{
	return Subtract(Exp10(value), One());
}



//-POWERS-&-ROOTS------------------------------------------------------------------------------------------------------

huge_number huge_number::Pow(const huge_number &value, const huge_number &exponent)
{
	huge_number result;

	if(checkPow(result, value, exponent)) {
		if(Equal(exponent, 2))
			return Square(value);

		// Odd integer powers keep the sign of the base
		if(value.isNegative()) {
			const huge_number magnitude = Pow(Abs(value), exponent);
			return exponent.isOddInteger() ? Negate(magnitude) : magnitude;
		}

		if(exponent.isNegative())
			return Divide(One(), Pow(value, Negate(exponent)));

		if(exponent.isInteger() && LessEqual(exponent, std::numeric_limits<int64_t>::max()))
			return power(value, exponent.toUInt64());

		if(TRACE_TRANSCENDENTAL) BOOST_LOG_TRIVIAL(trace) << "Pow " << value << " ^ " << exponent << " through exp and log";

		result = expGuarded(toWideFloat(exponent) * logSeries(value));
	}

	return result;
}

huge_number huge_number::Sqrt(const huge_number &value)
{
	huge_number result;

	if(checkSqrt(result, value))
		result = fromWideFloat(mp::sqrt(toWideFloat(value)));

	return result;
}

huge_number huge_number::Cbrt(const huge_number &value)
{
	if(value.isNaN() || value.isInfinity() || value.isZero())
		return value;

	const huge_number magnitude = expGuarded(logSeries(Abs(value)) / 3);

	return value.isNegative() ? Negate(magnitude) : magnitude;
}

huge_number huge_number::RootN(const huge_number &value, int n)
{
	huge_number result;

	if(checkRootN(result, value, n)) {
		if(n == 2)
			return Sqrt(value);
		if(n == -1)
			return Divide(One(), value);

		const huge_number magnitude = expGuarded(logSeries(Abs(value)) / n);

		result = value.isNegative() ? Negate(magnitude) : magnitude;
	}

	return result;
}

huge_number huge_number::Hypot(const huge_number &x, const huge_number &y)
{
	if(x.isInfinity() || y.isInfinity())
		return PositiveInfinity();
	if(x.isNaN() || y.isNaN())
		return NaN();
	if(x.isZero() && y.isZero())
		return Zero();

	const wide_float_t
			wideX = toWideFloat(x),
			wideY = toWideFloat(y);

	return fromWideFloat(mp::sqrt(wideX * wideX + wideY * wideY));
}

int huge_number::ILogB(const huge_number &value)
{
	if(!value.isFinite())
		return std::numeric_limits<int>::max();
	if(value.isZero())
		return std::numeric_limits<int>::min();

	const huge_number magnitude = Abs(value);
	const wide_float_t wide = toWideFloat(magnitude);

	const wide_float_t estimate = mp::floor(logSeries(magnitude) / constants::ln_two<wide_float_t>());
	int exponent = estimate.convert_to<int>();

	// The rounded logarithm can land one step off an exact power of two
	const wide_float_t power = mp::ldexp(wide_float_t(1), exponent);

	if(power > wide)
		--exponent;
	else if(power * 2 <= wide)
		++exponent;

	return exponent;
}
