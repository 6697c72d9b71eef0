#pragma once
#include <cstdint>
#include <string>
#include <string_view>

// Plain decimal text <-> sign + scaled magnitude. No locale, no exponent.
struct DecimalText {
  bool     negative;
  uint64_t magnitude;   // scaled by 10^precision
  uint8_t  precision;   // number of fractional digits seen
};

// Accepts [+-]digits[.digits]. Throws InvalidInput on malformed text,
// InvalidPrecision on more than FIXED_PRECISION_MAX fractional digits and
// NumericOverflow when the magnitude does not fit 64 bits.
DecimalText parse_decimal(std::string_view text);

// Prints exactly `precision` fractional digits. "-" only for a non-zero magnitude.
std::string format_decimal(bool negative, uint64_t magnitude, uint8_t precision);
