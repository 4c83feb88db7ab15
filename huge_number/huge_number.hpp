#pragma once

#include <cstdint>
#include <iosfwd>
#include <iterator>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

struct format_info;
enum class number_styles : unsigned;

class huge_number {

	//-TYPE-DEFINITIONS------------------------------------------------------------------------------------------------
public:

	// Significant digits, sign-carrying
	using mantissa_t = int64_t;
	using umantissa_t = uint64_t;

	// Power of ten applied to the mantissa
	using exponent_t = int16_t;

	// Divisor of an exact rational, 0 marks NaN and the infinities
	using denominator_t = uint16_t;

	// Decimal digit count of a mantissa
	using digits_t = uint8_t;

	// Rounding applied by Round when a value lies between two results
	enum class MidpointRounding {
		ToEven,
		AwayFromZero,
		ToZero,
		ToNegativeInfinity,
		ToPositiveInfinity
	};



	//-CONSTANT-DEFINITIONS--------------------------------------------------------------------------------------------

	static constexpr digits_t MantissaSignificantDigits = 18;

	static constexpr mantissa_t MaxMantissa = 999999999999999999;
	static constexpr mantissa_t MinMantissa = -MaxMantissa;

	static constexpr exponent_t MaxExponent = std::numeric_limits<exponent_t>::max();
	static constexpr exponent_t MinExponent = std::numeric_limits<exponent_t>::min();

	static constexpr denominator_t MaxDenominator = std::numeric_limits<denominator_t>::max();
	static constexpr denominator_t DefaultDenominator = 1;

	// Field values reserved for NaN and the infinities
	static constexpr denominator_t SentinelDenominator = 0;
	static constexpr exponent_t SentinelExponent = MaxExponent;
	static constexpr mantissa_t PositiveInfinityMantissa = std::numeric_limits<mantissa_t>::max();
	static constexpr mantissa_t NegativeInfinityMantissa = -PositiveInfinityMantissa;

	// Exponent carried by the negative zero
	static constexpr exponent_t NegativeZeroExponent = -1;



	//-MEMBER-DECLARATIONS---------------------------------------------------------------------------------------------
	// Value = m_mantissa / m_denominator * 10^m_exponent
private:

	mantissa_t m_mantissa = 0;
	exponent_t m_exponent = 0;
	denominator_t m_denominator = DefaultDenominator;



	//-DEFAULT-CONSTRUCTORS-&-ASSIGNMENTS------------------------------------------------------------------------------
public:
	huge_number() = default;
	huge_number(const huge_number &) = default;
	huge_number(huge_number &&) noexcept = default;
	huge_number &operator=(const huge_number &) = default;
	huge_number &operator=(huge_number &&) noexcept = default;



	//-CONSTRUCTORS----------------------------------------------------------------------------------------------------

	// Implicitly convertible constructor from any integral value
	template<typename T, typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	inline huge_number(T value) :
			huge_number(Reduce(value < T(0), Magnitude(value), 0)) {}

	// Implicitly convertible constructor from a floating value, using its shortest round-trip digits
	huge_number(double value);

	// mantissa * 10^exponent
	explicit huge_number(mantissa_t mantissa, int exponent);

	// numerator / denominator * 10^exponent, kept exact where the fields allow it
	explicit huge_number(mantissa_t numerator, denominator_t denominator, int exponent);

	// value * 10^exponent
	static huge_number FromDouble(double value, int exponent);


	// Special value constructors
	static inline constexpr huge_number Zero() { return huge_number(0, 0, DefaultDenominator, RawFields{}); }
	static inline constexpr huge_number NegativeZero()
	{
		return huge_number(0, NegativeZeroExponent, DefaultDenominator, RawFields{});
	}
	static inline constexpr huge_number One() { return huge_number(1, 0, DefaultDenominator, RawFields{}); }
	static inline constexpr huge_number NegativeOne() { return huge_number(-1, 0, DefaultDenominator, RawFields{}); }
	static inline constexpr huge_number NaN()
	{
		return huge_number(0, SentinelExponent, SentinelDenominator, RawFields{});
	}
	static inline constexpr huge_number PositiveInfinity()
	{
		return huge_number(PositiveInfinityMantissa, SentinelExponent, SentinelDenominator, RawFields{});
	}
	static inline constexpr huge_number NegativeInfinity()
	{
		return huge_number(NegativeInfinityMantissa, SentinelExponent, SentinelDenominator, RawFields{});
	}
	static inline constexpr huge_number MaxValue()
	{
		return huge_number(MaxMantissa, MaxExponent, DefaultDenominator, RawFields{});
	}
	static inline constexpr huge_number MinValue()
	{
		return huge_number(MinMantissa, MaxExponent, DefaultDenominator, RawFields{});
	}
	// Smallest positive value
	static inline constexpr huge_number Epsilon()
	{
		return huge_number(1, MinExponent, DefaultDenominator, RawFields{});
	}
	// Threshold of isNearlyZero
	static inline constexpr huge_number NearlyZero() { return huge_number(1, -15, DefaultDenominator, RawFields{}); }



	//-MEMBER-ACCESSORS------------------------------------------------------------------------------------------------

	inline constexpr mantissa_t mantissa() const noexcept { return m_mantissa; }
	inline constexpr exponent_t exponent() const noexcept { return m_exponent; }
	inline constexpr denominator_t denominator() const noexcept { return m_denominator; }
	digits_t mantissaDigits() const noexcept;

	inline constexpr bool isNaN() const noexcept { return (m_mantissa == 0) & (m_denominator == SentinelDenominator); }
	inline constexpr bool isPositiveInfinity() const noexcept
	{
		return (m_mantissa > 0) & (m_denominator == SentinelDenominator);
	}
	inline constexpr bool isNegativeInfinity() const noexcept
	{
		return (m_mantissa < 0) & (m_denominator == SentinelDenominator);
	}
	inline constexpr bool isInfinity() const noexcept { return (m_mantissa != 0) & (m_denominator == SentinelDenominator); }
	inline constexpr bool isFinite() const noexcept { return m_denominator != SentinelDenominator; }
	inline constexpr bool isZero() const noexcept { return (m_mantissa == 0) & isFinite(); }
	inline constexpr bool isNegativeZero() const noexcept { return isZero() & (m_exponent < 0); }
	inline constexpr bool isPositive() const noexcept { return (m_mantissa > 0) | (isZero() & (m_exponent >= 0)); }
	inline constexpr bool isNegative() const noexcept { return (m_mantissa < 0) | isNegativeZero(); }
	inline constexpr bool isRational() const noexcept { return m_denominator > DefaultDenominator; }

	// Values whose representation may have lost precision
	inline constexpr bool isNotRational() const noexcept
	{
		return !isFinite() | ((m_denominator == DefaultDenominator) & (m_exponent != 0));
	}

	// -1, 0 or 1 by the sign of the mantissa, 0 for NaN
	inline constexpr int sign() const noexcept { return (m_mantissa > 0) - (m_mantissa < 0); }

	bool isInteger() const;
	bool isEvenInteger() const;
	bool isOddInteger() const;
	bool isNearlyZero() const;
	bool isNearlyEqualTo(const huge_number &other) const;
	bool isNearlyEqualTo(const huge_number &other, const huge_number &epsilon) const;



	//-CONVERSIONS-----------------------------------------------------------------------------------------------------

	double toDouble() const noexcept;
	int64_t toInt64() const;
	uint64_t toUInt64() const;

	explicit inline operator double() const noexcept { return toDouble(); }

	// Returns true if number is non-zero
	explicit inline operator bool() const noexcept { return m_mantissa != 0; }

	std::string toString() const;



	//-OPERATORS-------------------------------------------------------------------------------------------------------

	huge_number operator-() const;
	inline huge_number operator+() const { return *this; }

	huge_number &operator+=(const huge_number &other);
	huge_number &operator-=(const huge_number &other);
	huge_number &operator*=(const huge_number &other);
	huge_number &operator/=(const huge_number &other);
	huge_number &operator%=(const huge_number &other);
	huge_number &operator++();
	huge_number &operator--();
	huge_number operator++(int);
	huge_number operator--(int);



	//-INTERNAL-HELPER-METHODS-----------------------------------------------------------------------------------------
private:

	struct RawFields {};

	// Stores the fields as given, without normalization
	inline constexpr huge_number(mantissa_t mantissa, exponent_t exponent, denominator_t denominator, RawFields) noexcept :
			m_mantissa{mantissa},
			m_exponent{exponent},
			m_denominator{denominator} {}

	template<typename T>
	static inline constexpr umantissa_t Magnitude(T value) noexcept
	{
		return value < T(0) ? umantissa_t(0) - umantissa_t(value) : umantissa_t(value);
	}



	//-NORMALIZER------------------------------------------------------------------------------------------------------
public:

	// Canonical value of +-magnitude * 10^exponent; overflow becomes a signed infinity, underflow a signed zero
	static huge_number Reduce(bool negative, umantissa_t magnitude, int exponent);
	static huge_number Reduce(mantissa_t mantissa, int exponent);

	static umantissa_t GreatestCommonFactor(umantissa_t left, umantissa_t right) noexcept;
	// Returns 0 when the multiple does not fit a denominator
	static denominator_t LeastCommonMultiple(denominator_t left, denominator_t right) noexcept;

	// Nearest decimal (denominator 1) value
	static huge_number ToDecimal(const huge_number &value);



	//-STATIC-ARITHMETIC-HELPER-METHODS--------------------------------------------------------------------------------

	static huge_number Add(const huge_number &left, const huge_number &right);
	static huge_number Subtract(const huge_number &left, const huge_number &right);
	static huge_number Multiply(const huge_number &left, const huge_number &right);
	static huge_number Divide(const huge_number &dividend, const huge_number &divisor);
	static huge_number Mod(const huge_number &dividend, const huge_number &divisor);
	static std::pair<huge_number, huge_number> DivRem(const huge_number &dividend, const huge_number &divisor);
	static huge_number IEEERemainder(const huge_number &x, const huge_number &y);
	static huge_number Square(const huge_number &value);
	static huge_number Cube(const huge_number &value);
	static huge_number FusedMultiplyAdd(const huge_number &x, const huge_number &y, const huge_number &z);
	static huge_number ScaleB(const huge_number &value, int n);
	// NaN for a zero, small integers and rationals invert exactly
	static huge_number Reciprocal(const huge_number &value);

	static huge_number Negate(const huge_number &value);
	static huge_number Abs(const huge_number &value);
	static huge_number CopySign(const huge_number &value, const huge_number &sign);
	static huge_number Min(const huge_number &left, const huge_number &right);
	static huge_number Max(const huge_number &left, const huge_number &right);
	static huge_number Clamp(const huge_number &value, const huge_number &min, const huge_number &max);
	static huge_number MaxMagnitude(const huge_number &left, const huge_number &right);
	static huge_number MinMagnitude(const huge_number &left, const huge_number &right);
	// NaN operands are ignored in favour of the other one
	static huge_number MaxMagnitudeNumber(const huge_number &left, const huge_number &right);
	static huge_number MinMagnitudeNumber(const huge_number &left, const huge_number &right);

	static huge_number GetEpsilon(const huge_number &value);
	static huge_number Increment(const huge_number &value);
	static huge_number Decrement(const huge_number &value);
	static huge_number BitIncrement(const huge_number &value);
	static huge_number BitDecrement(const huge_number &value);

	static huge_number Lerp(const huge_number &first, const huge_number &second, const huge_number &amount);
	static huge_number InverseLerp(const huge_number &first, const huge_number &second, const huge_number &result);
	static huge_number SnapTo(const huge_number &value, const huge_number &target);
	static huge_number SnapToZero(const huge_number &value);

	template<typename It>
	static huge_number Sum(It first, It last);
	template<typename It>
	static huge_number Average(It first, It last);
	template<typename It>
	static huge_number Minimum(It first, It last);
	template<typename It>
	static huge_number Maximum(It first, It last);



	//-STATIC-ROUNDING-HELPER-METHODS----------------------------------------------------------------------------------

	static huge_number Round(const huge_number &value, int digits = 0, MidpointRounding mode = MidpointRounding::ToEven);
	static huge_number Round(const huge_number &value, MidpointRounding mode);
	static huge_number Floor(const huge_number &value);
	static huge_number Ceiling(const huge_number &value);
	static huge_number Truncate(const huge_number &value);
	static int64_t RoundToInt64(const huge_number &value, MidpointRounding mode = MidpointRounding::ToEven);



	//-STATIC-COMPARISON-HELPER-METHODS--------------------------------------------------------------------------------

	// Total order, NaN sorts below everything and equal to itself
	static int CompareTo(const huge_number &left, const huge_number &right);

	// Field equality, NaN is never equal
	static bool Equal(const huge_number &left, const huge_number &right);
	static bool NotEqual(const huge_number &left, const huge_number &right);
	static bool Less(const huge_number &left, const huge_number &right);
	static bool LessEqual(const huge_number &left, const huge_number &right);
	static bool More(const huge_number &left, const huge_number &right);
	static bool MoreEqual(const huge_number &left, const huge_number &right);



	//-STATIC-TRANSCENDENTAL-HELPER-METHODS----------------------------------------------------------------------------

	static huge_number Log(const huge_number &value);
	static huge_number Log(const huge_number &value, const huge_number &base);
	static huge_number Log2(const huge_number &value);
	static huge_number Log10(const huge_number &value);
	static huge_number LogP1(const huge_number &value);
	static huge_number Log2P1(const huge_number &value);
	static huge_number Log10P1(const huge_number &value);

	static huge_number Exp(const huge_number &value);
	static huge_number Exp2(const huge_number &value);
	static huge_number Exp10(const huge_number &value);
	static huge_number ExpM1(const huge_number &value);
	static huge_number Exp2M1(const huge_number &value);
	static huge_number Exp10M1(const huge_number &value);

	static huge_number Pow(const huge_number &value, const huge_number &exponent);
	static huge_number Sqrt(const huge_number &value);
	static huge_number Cbrt(const huge_number &value);
	static huge_number RootN(const huge_number &value, int n);
	static huge_number Hypot(const huge_number &x, const huge_number &y);
	// floor(log2 |value|), int min for a zero and int max for NaN and the infinities
	static int ILogB(const huge_number &value);

	static huge_number Sin(const huge_number &value);
	static huge_number Cos(const huge_number &value);
	static huge_number Tan(const huge_number &value);
	static huge_number Asin(const huge_number &value);
	static huge_number Acos(const huge_number &value);
	static huge_number Atan(const huge_number &value);
	static huge_number Atan2(const huge_number &y, const huge_number &x);
	static std::pair<huge_number, huge_number> SinCos(const huge_number &value);

	// Angles measured in half turns, value * pi radians
	static huge_number SinPi(const huge_number &value);
	static huge_number CosPi(const huge_number &value);
	static huge_number TanPi(const huge_number &value);
	static std::pair<huge_number, huge_number> SinCosPi(const huge_number &value);
	static huge_number AsinPi(const huge_number &value);
	static huge_number AcosPi(const huge_number &value);
	static huge_number AtanPi(const huge_number &value);
	static huge_number Atan2Pi(const huge_number &y, const huge_number &x);

	static huge_number Sinh(const huge_number &value);
	static huge_number Cosh(const huge_number &value);
	static huge_number Tanh(const huge_number &value);
	static huge_number Asinh(const huge_number &value);
	static huge_number Acosh(const huge_number &value);
	static huge_number Atanh(const huge_number &value);



	//-TEXT-CONVERSIONS------------------------------------------------------------------------------------------------

	// Malformed or empty text sets result to NaN and returns false
	static bool TryParse(const std::string &text, number_styles style, const format_info &info, huge_number &result);
	static bool TryParse(const std::string &text, huge_number &result);

	// NaN on failure
	static huge_number Parse(const std::string &text, number_styles style, const format_info &info);
	static huge_number Parse(const std::string &text);

	// Throws std::invalid_argument for an unknown format
	static std::string ToString(const huge_number &value, const std::string &format, const format_info &info);
	static std::string ToString(const huge_number &value, const std::string &format);
	static std::string ToString(const huge_number &value);
};



//-RANGE-HELPER-METHODS------------------------------------------------------------------------------------------------

template<typename It>
huge_number huge_number::Sum(It first, It last)
{
	huge_number result = Zero();

	for(; first != last; ++first)
		result = Add(result, *first);

	return result;
}

template<typename It>
huge_number huge_number::Average(It first, It last)
{
	huge_number sum = Zero();
	uint64_t count = 0;

	for(; first != last; ++first, ++count)
		sum = Add(sum, *first);

	return count ? Divide(sum, count) : NaN();
}

template<typename It>
huge_number huge_number::Minimum(It first, It last)
{
	if(first == last)
		return NaN();

	huge_number result = *first;

	while(++first != last)
		result = Min(result, *first);

	return result;
}

template<typename It>
huge_number huge_number::Maximum(It first, It last)
{
	if(first == last)
		return NaN();

	huge_number result = *first;

	while(++first != last)
		result = Max(result, *first);

	return result;
}



//-GLOBAL-OPERATOR-OVERLOADS-------------------------------------------------------------------------------------------

huge_number operator+(const huge_number &left, const huge_number &right);
huge_number operator-(const huge_number &left, const huge_number &right);
huge_number operator*(const huge_number &left, const huge_number &right);
huge_number operator/(const huge_number &left, const huge_number &right);
huge_number operator%(const huge_number &left, const huge_number &right);

bool operator==(const huge_number &left, const huge_number &right);
bool operator!=(const huge_number &left, const huge_number &right);
bool operator<(const huge_number &left, const huge_number &right);
bool operator<=(const huge_number &left, const huge_number &right);
bool operator>(const huge_number &left, const huge_number &right);
bool operator>=(const huge_number &left, const huge_number &right);

std::ostream &operator<<(std::ostream &out, const huge_number &value);
