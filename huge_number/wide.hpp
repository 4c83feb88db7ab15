#pragma once

#include "huge_number.hpp"

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <string>

// Intermediate types for results that do not fit the stored fields
namespace mp = boost::multiprecision;

typedef mp::int256_t wide_int_t;
typedef mp::cpp_dec_float_50 wide_float_t;

// Largest power of ten an aligned wide_int_t operand is scaled by
constexpr int WideShiftLimit = 48;

wide_int_t pow10Wide(unsigned exponent);
unsigned wideDigits(const wide_int_t &value);

// Exact value of a finite number, denominator included
wide_float_t toWideFloat(const huge_number &value);

// digits * 10^exponent, rounded half away from zero to the mantissa width
huge_number fromDigits(bool negative, std::string digits, int exponent);
// Digits of the form d.ddd[e+xx] scaled by 10^exponent
huge_number fromScientific(bool negative, const std::string &text, int exponent);

huge_number fromWideInt(const wide_int_t &value, int exponent);
huge_number fromWideFloat(const wide_float_t &value, int exponent = 0);

// numerator / denominator * 10^exponent, rational when it fits the fields
huge_number fromWideRatio(wide_int_t numerator, wide_int_t denominator, int exponent);
