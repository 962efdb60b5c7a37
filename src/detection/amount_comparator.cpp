#include "txdedup/detection/amount_comparator.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace txdedup::detection {

namespace {

constexpr std::int64_t kUnitsPerCent = domain::Money::kScale / 100;

double round_half_up(double value, double scale) {
  return std::floor(value * scale + 0.5) / scale;
}

}  // namespace

bool amounts_match(domain::Money a, domain::Money b, domain::Money tolerance) {
  return domain::abs(a - b) < tolerance || domain::abs(a + b) < tolerance;
}

std::optional<double> percent_difference(domain::Money a, domain::Money b) {
  const std::int64_t diff_units = domain::abs(a - b).units;
  const std::int64_t sum_units = domain::abs(a + b).units;

  // avg = |a + b| / 2, rounded half-up to whole cents
  const std::int64_t avg_cents = (sum_units + kUnitsPerCent) / (2 * kUnitsPerCent);
  if (avg_cents == 0) {
    return std::nullopt;
  }

  const double ratio =
      static_cast<double>(diff_units) / static_cast<double>(avg_cents * kUnitsPerCent);
  return round_half_up(ratio, 10000.0);
}

double amount_similarity(domain::Money a, domain::Money b, const ScoringConfig& config) {
  const bool a_positive = a.units >= 0;
  const bool b_positive = b.units >= 0;
  if (a_positive != b_positive) {
    return config.opposite_sign_amount_score;
  }

  const auto percent = percent_difference(a, b);
  if (!percent.has_value()) {
    return a == b ? 1.0 : 0.0;
  }

  for (const auto& tier : config.amount_tiers) {
    if (*percent < tier.max_percent_diff) {
      return tier.score;
    }
  }
  return std::max(0.0, 1.0 - *percent);
}

}  // namespace txdedup::detection
