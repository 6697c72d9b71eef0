#pragma once
#include "domain/decimal_text.hpp"
#include "domain/fixed.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

inline constexpr double PRICE_MAX = 9223372036.0;
inline constexpr double PRICE_MIN = -PRICE_MAX;

// Signed decimal stored as raw = value * 10^precision.
class Price {
public:
  static Price from_double(double value, uint8_t precision) {
    if (std::isfinite(value) && (value > PRICE_MAX || value < PRICE_MIN)) {
      throw NumericOverflow("price " + std::to_string(value) + " outside [PRICE_MIN, PRICE_MAX]");
    }
    return Price(to_fixed(value, precision), precision);
  }

  static Price from_raw(int64_t raw, uint8_t precision) {
    check_precision(precision);
    return Price(raw, precision);
  }

  // Precision is the number of fractional digits in the text.
  static Price from_string(std::string_view text) {
    const DecimalText d = parse_decimal(text);
    const uint64_t limit = d.negative
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (d.magnitude > limit) {
      throw NumericOverflow("price '" + std::string(text) + "' exceeds int64 range");
    }
    // two's complement negation of the magnitude; exact for 2^63 as well
    const int64_t raw = d.negative ? static_cast<int64_t>(0 - d.magnitude)
                                   : static_cast<int64_t>(d.magnitude);
    return Price(raw, d.precision);
  }

  int64_t raw() const { return raw_; }
  uint8_t precision() const { return precision_; }

  double as_double() const { return to_float(raw_, precision_); }

  std::string to_string() const {
    const uint64_t mag = raw_ < 0 ? 0 - static_cast<uint64_t>(raw_) : static_cast<uint64_t>(raw_);
    return format_decimal(raw_ < 0, mag, precision_);
  }

  // Widening multiplies are checked, narrowing rounds ties to even.
  Price rescale(uint8_t new_precision) const {
    check_precision(new_precision);
    if (new_precision == precision_) return *this;

    if (new_precision > precision_) {
      const int64_t mul = POW10[new_precision - precision_];
      if (raw_ > 0 && raw_ > std::numeric_limits<int64_t>::max() / mul) throw NumericOverflow("rescale overflow");
      if (raw_ < 0 && raw_ < std::numeric_limits<int64_t>::min() / mul) throw NumericOverflow("rescale underflow");
      return Price(raw_ * mul, new_precision);
    }

    const int64_t div = POW10[precision_ - new_precision];
    int64_t q = raw_ / div;                       // trunc toward 0
    const int64_t rem  = raw_ % div;
    const int64_t twice = 2 * (rem < 0 ? -rem : rem);
    const int64_t step = raw_ < 0 ? -1 : 1;
    if (twice > div || (twice == div && (q % 2) != 0)) q += step;
    return Price(q, new_precision);
  }

  Price operator+(const Price& other) const {
    require_same_precision(other);
    if (other.raw_ > 0 && raw_ > std::numeric_limits<int64_t>::max() - other.raw_) throw NumericOverflow("price add overflow");
    if (other.raw_ < 0 && raw_ < std::numeric_limits<int64_t>::min() - other.raw_) throw NumericOverflow("price add underflow");
    return Price(raw_ + other.raw_, precision_);
  }

  Price operator-(const Price& other) const {
    require_same_precision(other);
    if (other.raw_ < 0 && raw_ > std::numeric_limits<int64_t>::max() + other.raw_) throw NumericOverflow("price sub overflow");
    if (other.raw_ > 0 && raw_ < std::numeric_limits<int64_t>::min() + other.raw_) throw NumericOverflow("price sub underflow");
    return Price(raw_ - other.raw_, precision_);
  }

  // Exact comparison across precisions.
  friend bool operator==(const Price& a, const Price& b) { return compare(a, b) == 0; }
  friend bool operator!=(const Price& a, const Price& b) { return compare(a, b) != 0; }
  friend bool operator< (const Price& a, const Price& b) { return compare(a, b) <  0; }
  friend bool operator<=(const Price& a, const Price& b) { return compare(a, b) <= 0; }
  friend bool operator> (const Price& a, const Price& b) { return compare(a, b) >  0; }
  friend bool operator>=(const Price& a, const Price& b) { return compare(a, b) >= 0; }

  friend std::ostream& operator<<(std::ostream& os, const Price& p) { return os << p.to_string(); }

private:
  Price(int64_t raw, uint8_t precision) : raw_(raw), precision_(precision) {}

  void require_same_precision(const Price& other) const {
    if (other.precision_ != precision_) {
      throw InvalidPrecision("precision mismatch " + std::to_string(precision_) +
                             " vs " + std::to_string(other.precision_));
    }
  }

  static int compare(const Price& a, const Price& b) {
    const uint8_t p = a.precision_ > b.precision_ ? a.precision_ : b.precision_;
    const __int128 x = static_cast<__int128>(a.raw_) * POW10[p - a.precision_];
    const __int128 y = static_cast<__int128>(b.raw_) * POW10[p - b.precision_];
    return (x < y) ? -1 : (x > y) ? 1 : 0;
  }

  int64_t raw_;
  uint8_t precision_;
};
