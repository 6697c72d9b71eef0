#pragma once
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

// Double <-> scaled integer conversions.
// A fixed value is round(value * 10^precision), precision in [0, FIXED_PRECISION_MAX].

inline constexpr uint8_t FIXED_PRECISION_MAX = 9;
inline constexpr int64_t POW10[FIXED_PRECISION_MAX + 1] = {
  1LL,10LL,100LL,1000LL,10000LL,100000LL,1000000LL,10000000LL,100000000LL,
  1000000000LL
};

struct InvalidPrecision : std::invalid_argument {
  explicit InvalidPrecision(unsigned precision)
    : std::invalid_argument("precision " + std::to_string(precision) +
                            " out of range [0, " + std::to_string(FIXED_PRECISION_MAX) + "]") {}
  explicit InvalidPrecision(const std::string& what) : std::invalid_argument(what) {}
};

struct InvalidInput : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct NumericOverflow : std::overflow_error {
  using std::overflow_error::overflow_error;
};

inline void check_precision(unsigned precision) {
  if (precision > FIXED_PRECISION_MAX) throw InvalidPrecision(precision);
}

inline int64_t scale_factor(unsigned precision) {
  check_precision(precision);
  return POW10[precision];
}

// Nearest integer, ties to even. Does not depend on the FP rounding mode.
inline double round_half_even(double x) {
  const double r = std::round(x);  // ties away from zero
  if (std::fabs(x - std::trunc(x)) != 0.5) return r;
  return 2.0 * std::round(x / 2.0);
}

namespace detail {
// 2^63 and 2^64 are exact doubles; INT64_MAX and UINT64_MAX are not.
inline constexpr double kTwoPow63 = 9223372036854775808.0;
inline constexpr double kTwoPow64 = 18446744073709551616.0;

inline double scaled_rounded(double value, unsigned precision) {
  check_precision(precision);
  if (!std::isfinite(value)) {
    throw InvalidInput("non-finite value " + std::to_string(value));
  }
  return round_half_even(value * static_cast<double>(POW10[precision]));
}
}  // namespace detail

inline int64_t to_fixed(double value, uint8_t precision) {
  const double r = detail::scaled_rounded(value, precision);
  if (r >= detail::kTwoPow63 || r < -detail::kTwoPow63) {
    throw NumericOverflow("value " + std::to_string(value) + " at precision " +
                          std::to_string(precision) + " exceeds int64 range");
  }
  return static_cast<int64_t>(r);  // -0.0 -> 0
}

inline double to_float(int64_t value, uint8_t precision) {
  check_precision(precision);
  return static_cast<double>(value) / static_cast<double>(POW10[precision]);
}

inline uint64_t to_fixed_unsigned(double value, uint8_t precision) {
  const double r = detail::scaled_rounded(value, precision);
  if (r < 0.0) {
    throw InvalidInput("negative value " + std::to_string(value) + " for unsigned fixed");
  }
  if (r >= detail::kTwoPow64) {
    throw NumericOverflow("value " + std::to_string(value) + " at precision " +
                          std::to_string(precision) + " exceeds uint64 range");
  }
  return static_cast<uint64_t>(r);
}

inline double to_float_unsigned(uint64_t value, uint8_t precision) {
  check_precision(precision);
  return static_cast<double>(value) / static_cast<double>(POW10[precision]);
}
