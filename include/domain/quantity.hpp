#pragma once
#include "domain/decimal_text.hpp"
#include "domain/fixed.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

inline constexpr double QUANTITY_MAX = 18446744073.0;

// Non-negative decimal stored as raw = value * 10^precision.
class Quantity {
public:
  static Quantity from_double(double value, uint8_t precision) {
    if (std::isfinite(value) && value > QUANTITY_MAX) {
      throw NumericOverflow("quantity " + std::to_string(value) + " above QUANTITY_MAX");
    }
    return Quantity(to_fixed_unsigned(value, precision), precision);
  }

  static Quantity from_raw(uint64_t raw, uint8_t precision) {
    check_precision(precision);
    return Quantity(raw, precision);
  }

  static Quantity from_string(std::string_view text) {
    const DecimalText d = parse_decimal(text);
    if (d.negative && d.magnitude != 0) {
      throw InvalidInput("negative quantity '" + std::string(text) + "'");
    }
    return Quantity(d.magnitude, d.precision);
  }

  uint64_t raw() const { return raw_; }
  uint8_t precision() const { return precision_; }
  bool is_zero() const { return raw_ == 0; }

  double as_double() const { return to_float_unsigned(raw_, precision_); }

  std::string to_string() const { return format_decimal(false, raw_, precision_); }

  Quantity rescale(uint8_t new_precision) const {
    check_precision(new_precision);
    if (new_precision == precision_) return *this;

    if (new_precision > precision_) {
      const uint64_t mul = static_cast<uint64_t>(POW10[new_precision - precision_]);
      if (raw_ > std::numeric_limits<uint64_t>::max() / mul) throw NumericOverflow("rescale overflow");
      return Quantity(raw_ * mul, new_precision);
    }

    const uint64_t div = static_cast<uint64_t>(POW10[precision_ - new_precision]);
    uint64_t q = raw_ / div;
    const uint64_t twice = 2 * (raw_ % div);
    if (twice > div || (twice == div && (q % 2) != 0)) ++q;
    return Quantity(q, new_precision);
  }

  Quantity operator+(const Quantity& other) const {
    require_same_precision(other);
    if (raw_ > std::numeric_limits<uint64_t>::max() - other.raw_) throw NumericOverflow("quantity add overflow");
    return Quantity(raw_ + other.raw_, precision_);
  }

  Quantity operator-(const Quantity& other) const {
    require_same_precision(other);
    if (other.raw_ > raw_) throw NumericOverflow("quantity sub below zero");
    return Quantity(raw_ - other.raw_, precision_);
  }

  friend bool operator==(const Quantity& a, const Quantity& b) { return compare(a, b) == 0; }
  friend bool operator!=(const Quantity& a, const Quantity& b) { return compare(a, b) != 0; }
  friend bool operator< (const Quantity& a, const Quantity& b) { return compare(a, b) <  0; }
  friend bool operator<=(const Quantity& a, const Quantity& b) { return compare(a, b) <= 0; }
  friend bool operator> (const Quantity& a, const Quantity& b) { return compare(a, b) >  0; }
  friend bool operator>=(const Quantity& a, const Quantity& b) { return compare(a, b) >= 0; }

  friend std::ostream& operator<<(std::ostream& os, const Quantity& q) { return os << q.to_string(); }

private:
  Quantity(uint64_t raw, uint8_t precision) : raw_(raw), precision_(precision) {}

  void require_same_precision(const Quantity& other) const {
    if (other.precision_ != precision_) {
      throw InvalidPrecision("precision mismatch " + std::to_string(precision_) +
                             " vs " + std::to_string(other.precision_));
    }
  }

  static int compare(const Quantity& a, const Quantity& b) {
    const uint8_t p = a.precision_ > b.precision_ ? a.precision_ : b.precision_;
    const unsigned __int128 x = static_cast<unsigned __int128>(a.raw_) * POW10[p - a.precision_];
    const unsigned __int128 y = static_cast<unsigned __int128>(b.raw_) * POW10[p - b.precision_];
    return (x < y) ? -1 : (x > y) ? 1 : 0;
  }

  uint64_t raw_;
  uint8_t precision_;
};
