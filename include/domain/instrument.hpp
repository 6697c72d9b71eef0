#pragma once
#include "domain/fixed.hpp"
#include "domain/price.hpp"
#include "domain/quantity.hpp"
#include "utils/strings.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// Symbol plus the precisions its prices and sizes are quoted in.
struct Instrument {
  std::string symbol;
  uint8_t     price_precision;
  uint8_t     size_precision;

  // Factory that enforces normalization
  static Instrument Make(std::string symbol, unsigned price_precision, unsigned size_precision) {
    std::string normalized = normalize_symbol(symbol);
    if (normalized.empty()) throw InvalidInput("symbol is required");
    check_precision(price_precision);
    check_precision(size_precision);
    return Instrument{std::move(normalized),
                      static_cast<uint8_t>(price_precision),
                      static_cast<uint8_t>(size_precision)};
  }

  Price make_price(double value) const { return Price::from_double(value, price_precision); }
  Quantity make_qty(double value) const { return Quantity::from_double(value, size_precision); }

  // Text with more digits than the instrument carries is rounded ties-to-even.
  Price parse_price(std::string_view text) const { return Price::from_string(text).rescale(price_precision); }
  Quantity parse_qty(std::string_view text) const { return Quantity::from_string(text).rescale(size_precision); }
};
