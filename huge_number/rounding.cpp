#include "huge_number.hpp"
#include "wide.hpp"

#include <boost/log/trivial.hpp>

//#define TRACE_ROUNDING	1

#ifndef TRACE_ROUNDING
#define TRACE_ROUNDING	0 // don't test
#endif



//-TYPE-DEFINITIONS----------------------------------------------------------------------------------------------------

using MidpointRounding = huge_number::MidpointRounding;



//-ROUNDING-PRELIMINARY-CHECKS-----------------------------------------------------------------------------------------
//    These functions are run before the actual computation to do bound checking, and return true if they pass
//    If they return false, they MUST set the result and that value will be returned

static bool checkRound(huge_number &result, const huge_number &value, int digits)
{
	const bool
			nan = value.isNaN(),
			infinity = value.isInfinity(),
			zero = value.isZero(),
			// Already without digits below the requested position
			exact = !value.isRational() && int(value.exponent()) + digits >= 0;

	if(nan | infinity | zero | exact)
		result = value;
	else
		return true;
	return false;
}



//-QUOTIENT-ADJUSTMENT-------------------------------------------------------------------------------------------------

// Whether the truncated quotient moves one unit away from zero
//     half compares the remainder with half of the divisor, -1 below, 0 at, 1 above
static bool roundsAway(MidpointRounding mode, bool negative, bool odd, bool inexact, int half) noexcept
{
	switch(mode) {
		case MidpointRounding::ToEven:
			return half > 0 || (half == 0 && odd);
		case MidpointRounding::AwayFromZero:
			return half >= 0 && inexact;
		case MidpointRounding::ToZero:
			return false;
		case MidpointRounding::ToNegativeInfinity:
			return negative && inexact;
		case MidpointRounding::ToPositiveInfinity:
			return !negative && inexact;
	}

	return false;
}



//-STATIC-ROUNDING-HELPER-METHODS--------------------------------------------------------------------------------------

huge_number huge_number::Round(const huge_number &value, int digits, MidpointRounding mode)
{
	huge_number result;

	if(checkRound(result, value, digits)) {
		// value * 10^digits = numerator * 10^shift / denominator
		const int shift = int(value.m_exponent) + digits;
		const bool negative = value.m_mantissa < 0;

		// Integer digits beyond the wide range, nothing left to round
		if(shift > WideShiftLimit)
			return ToDecimal(value);

		wide_int_t
				numerator = mp::abs(wide_int_t(value.m_mantissa)),
				divisor = value.m_denominator;

		wide_int_t quotient = 0, remainder = numerator;
		int half = -1;

		if(shift >= 0)
			numerator *= pow10Wide(unsigned(shift));
		else if(shift >= -WideShiftLimit)
			divisor *= pow10Wide(unsigned(-shift));

		// A shift below the wide range leaves a quotient of zero under one half
		if(shift >= -WideShiftLimit) {
			quotient = numerator / divisor;
			remainder = numerator % divisor;
			half = (remainder * 2 > divisor) - (remainder * 2 < divisor);
		}

		if(TRACE_ROUNDING) BOOST_LOG_TRIVIAL(trace) << "Round " << value << " digits " << digits << " quotient " << quotient << " remainder " << remainder;

		if(roundsAway(mode, negative, quotient % 2 != 0, remainder != 0, half))
			++quotient;

		if(quotient == 0)
			return negative ? NegativeZero() : Zero();

		result = fromWideInt(negative ? wide_int_t(-quotient) : quotient, -digits);
	}

	return result;
}

huge_number huge_number::Round(const huge_number &value, MidpointRounding mode)
{
	return Round(value, 0, mode);
}

huge_number huge_number::Floor(const huge_number &value)
{
	return Round(value, 0, MidpointRounding::ToNegativeInfinity);
}

huge_number huge_number::Ceiling(const huge_number &value)
{
	return Round(value, 0, MidpointRounding::ToPositiveInfinity);
}

huge_number huge_number::Truncate(const huge_number &value)
{
	return Round(value, 0, MidpointRounding::ToZero);
}

int64_t huge_number::RoundToInt64(const huge_number &value, MidpointRounding mode)
{
	return Round(value, 0, mode).toInt64();
}
