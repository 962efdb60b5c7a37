#include "txdedup/domain/money.h"

#include "txdedup/core/normalization.h"

#include <cmath>

namespace txdedup::domain {

core::Result<Money, core::ParseError> Money::from_double(double value) {
  using R = core::Result<Money, core::ParseError>;

  const double scaled = value * static_cast<double>(kScale);
  if (!std::isfinite(scaled) || std::fabs(scaled) > static_cast<double>(kMaxUnits)) {
    return R::err(core::ParseError::kOutOfRange);
  }
  return R::ok(Money{static_cast<std::int64_t>(std::llround(scaled))});
}

core::Result<Money, core::ParseError> parse_money(std::string_view text) {
  using R = core::Result<Money, core::ParseError>;

  const std::string trimmed = core::trim(text);
  std::string_view s{trimmed};
  if (s.empty()) {
    return R::err(core::ParseError::kMissingField);
  }

  bool negative = false;
  if (s.front() == '-' || s.front() == '+') {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }

  constexpr std::int64_t kMaxWhole = Money::kMaxUnits / Money::kScale;

  std::int64_t whole = 0;
  std::int64_t fraction = 0;
  int fraction_digits = 0;
  bool seen_point = false;
  bool seen_digit = false;

  for (const char ch : s) {
    if (ch == '.') {
      if (seen_point) {
        return R::err(core::ParseError::kInvalidFormat);
      }
      seen_point = true;
      continue;
    }
    if (ch < '0' || ch > '9') {
      return R::err(core::ParseError::kInvalidFormat);
    }
    seen_digit = true;
    if (seen_point) {
      if (fraction_digits == 4) {
        return R::err(core::ParseError::kOutOfRange);
      }
      fraction = fraction * 10 + (ch - '0');
      ++fraction_digits;
    } else {
      whole = whole * 10 + (ch - '0');
      if (whole > kMaxWhole) {
        return R::err(core::ParseError::kOutOfRange);
      }
    }
  }

  if (!seen_digit) {
    return R::err(core::ParseError::kInvalidFormat);
  }

  for (int i = fraction_digits; i < 4; ++i) {
    fraction *= 10;
  }

  const std::int64_t units = whole * Money::kScale + fraction;
  if (units > Money::kMaxUnits) {
    return R::err(core::ParseError::kOutOfRange);
  }
  return R::ok(Money{negative ? -units : units});
}

std::string format_money(Money amount) {
  const bool negative = amount.units < 0;
  const std::int64_t magnitude = negative ? -amount.units : amount.units;
  const std::int64_t whole = magnitude / Money::kScale;
  const std::int64_t fraction = magnitude % Money::kScale;

  std::string digits = std::to_string(fraction);
  digits.insert(0, 4 - digits.size(), '0');
  // Keep two decimals, drop trailing zeros beyond them
  while (digits.size() > 2 && digits.back() == '0') {
    digits.pop_back();
  }

  return (negative ? "-" : "") + std::to_string(whole) + "." + digits;
}

}  // namespace txdedup::domain
