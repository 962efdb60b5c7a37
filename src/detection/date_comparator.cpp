#include "txdedup/detection/date_comparator.h"

namespace txdedup::detection {

namespace {

double score_gap(long days, const ScoringConfig& config) {
  for (const auto& tier : config.date_tiers) {
    if (days <= tier.max_days) {
      return tier.score;
    }
  }
  return config.date_score_beyond_tiers;
}

}  // namespace

bool dates_equal(const std::optional<core::Date>& a, const std::optional<core::Date>& b) {
  if (a.has_value() && b.has_value()) {
    return *a == *b;
  }
  return !a.has_value() && !b.has_value();
}

double date_similarity(const std::optional<core::Date>& a, const std::optional<core::Date>& b,
                       const ScoringConfig& config) {
  if (!a.has_value() || !b.has_value()) {
    return dates_equal(a, b) ? score_gap(0, config) : 0.0;
  }
  return score_gap(core::days_between(*a, *b), config);
}

}  // namespace txdedup::detection
