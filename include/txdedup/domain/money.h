#pragma once

#include "txdedup/core/result.h"

#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace txdedup::domain {

// Money is a signed fixed-point amount with four decimal places.
// Negative amounts are debits/expenses, positive amounts are credits/income.
// Statement amounts carry at most cents, the extra places keep sub-cent
// aggregator amounts exact so tolerance checks never see binary rounding noise.
struct Money {
  static constexpr std::int64_t kScale = 10000;
  // Largest accepted magnitude. Sums and differences of two in-range amounts
  // stay representable.
  static constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max() / 4;

  std::int64_t units{0};

  [[nodiscard]] static constexpr Money from_units(std::int64_t units) { return Money{units}; }
  [[nodiscard]] static constexpr Money from_cents(std::int64_t cents) { return Money{cents * 100}; }
  // Rounds half away from zero to the nearest unit. Non-finite values and
  // magnitudes above kMaxUnits are kOutOfRange.
  [[nodiscard]] static core::Result<Money, core::ParseError> from_double(double value);

  [[nodiscard]] double to_double() const {
    return static_cast<double>(units) / static_cast<double>(kScale);
  }
  [[nodiscard]] constexpr bool is_negative() const { return units < 0; }

  auto operator<=>(const Money&) const = default;
};

inline Money operator+(Money a, Money b) { return Money{a.units + b.units}; }
inline Money operator-(Money a, Money b) { return Money{a.units - b.units}; }
inline Money abs(Money m) { return Money{m.units < 0 ? -m.units : m.units}; }

// parse_money accepts an optional sign, digits and up to four fractional digits:
// "-42.50", "+15.99", "100", ".5". Thousands separators and currency symbols are rejected.
[[nodiscard]] core::Result<Money, core::ParseError> parse_money(std::string_view text);

// format_money renders the shortest representation with at least two decimals ("-42.50").
[[nodiscard]] std::string format_money(Money amount);

}  // namespace txdedup::domain
