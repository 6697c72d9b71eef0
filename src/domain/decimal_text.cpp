#include "domain/decimal_text.hpp"
#include "domain/fixed.hpp"

#include <limits>

DecimalText parse_decimal(std::string_view text) {
  DecimalText out{false, 0, 0};
  size_t i = 0;

  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    out.negative = (text[i] == '-');
    ++i;
  }

  bool seen_dot = false;
  size_t int_digits = 0;
  unsigned frac_digits = 0;

  for (; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '.') {
      if (seen_dot || int_digits == 0) throw InvalidInput("malformed decimal '" + std::string(text) + "'");
      seen_dot = true;
      continue;
    }
    if (ch < '0' || ch > '9') throw InvalidInput("malformed decimal '" + std::string(text) + "'");

    // digit count decides before magnitude: "1.000...0" is a precision error
    if (seen_dot) check_precision(frac_digits + 1);

    const uint64_t d = static_cast<uint64_t>(ch - '0');
    if (out.magnitude > (std::numeric_limits<uint64_t>::max() - d) / 10) {
      throw NumericOverflow("decimal '" + std::string(text) + "' exceeds 64-bit range");
    }
    out.magnitude = out.magnitude * 10 + d;

    if (seen_dot) ++frac_digits;
    else          ++int_digits;
  }

  if (int_digits == 0 || (seen_dot && frac_digits == 0)) {
    throw InvalidInput("malformed decimal '" + std::string(text) + "'");
  }
  out.precision = static_cast<uint8_t>(frac_digits);
  return out;
}

std::string format_decimal(bool negative, uint64_t magnitude, uint8_t precision) {
  check_precision(precision);
  const uint64_t scale = static_cast<uint64_t>(POW10[precision]);

  std::string out;
  if (negative && magnitude != 0) out.push_back('-');
  out += std::to_string(magnitude / scale);

  if (precision > 0) {
    const std::string frac = std::to_string(magnitude % scale);
    out.push_back('.');
    out.append(precision - frac.size(), '0');
    out += frac;
  }
  return out;
}
