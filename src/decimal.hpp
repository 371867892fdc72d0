#ifndef LOANCALC_DECIMAL_HPP
#define LOANCALC_DECIMAL_HPP

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <string>

namespace loancalc {

// Significant decimal digits carried by all money and rate arithmetic.
// Precision is part of the type, so every engine invocation gets the same
// context without any process-wide setting.
constexpr unsigned DECIMAL_DIGITS = 28;

using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<DECIMAL_DIGITS>,
    boost::multiprecision::et_off>;

// Parse a plain decimal literal: optional sign, digits, optional fraction.
// Throws std::invalid_argument on anything else (including empty input).
Decimal parse_decimal(const std::string& text);

// Fixed-point rendering with the given number of fractional digits.
// Values that round to zero are printed without a sign.
std::string format_decimal(const Decimal& value, int places = 2);

// Lossy conversion for binary-float consumers (Parquet columns)
double to_double(const Decimal& value);

} // namespace loancalc

#endif // LOANCALC_DECIMAL_HPP
