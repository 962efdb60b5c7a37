#include "txdedup/detection/scoring_config.h"

namespace txdedup::detection {

namespace {

bool in_unit_interval(double value) {
  return value >= 0.0 && value <= 1.0;
}

}  // namespace

core::Result<bool, std::string> ScoringConfig::validate() const {
  using R = core::Result<bool, std::string>;

  for (std::size_t i = 0; i < amount_tiers.size(); ++i) {
    const auto& tier = amount_tiers[i];
    if (tier.max_percent_diff <= 0.0 || !in_unit_interval(tier.score)) {
      return R::err("amount tier " + std::to_string(i) + " out of range");
    }
    if (i > 0 && tier.max_percent_diff <= amount_tiers[i - 1].max_percent_diff) {
      return R::err("amount tiers must have increasing max_percent_diff");
    }
  }

  for (std::size_t i = 0; i < date_tiers.size(); ++i) {
    const auto& tier = date_tiers[i];
    if (tier.max_days < 0 || !in_unit_interval(tier.score)) {
      return R::err("date tier " + std::to_string(i) + " out of range");
    }
    if (i > 0 && tier.max_days <= date_tiers[i - 1].max_days) {
      return R::err("date tiers must have increasing max_days");
    }
  }

  for (std::size_t i = 0; i < description_weight_tiers.size(); ++i) {
    const auto& tier = description_weight_tiers[i];
    if (!in_unit_interval(tier.min_similarity) || !in_unit_interval(tier.weight)) {
      return R::err("description weight tier " + std::to_string(i) + " out of range");
    }
    if (i > 0 && tier.min_similarity >= description_weight_tiers[i - 1].min_similarity) {
      return R::err("description weight tiers must have decreasing min_similarity");
    }
  }

  // NOLINTNEXTLINE(modernize-avoid-c-arrays)
  const double scores[] = {opposite_sign_amount_score, date_score_beyond_tiers,
                           description_weight_floor,   weights.amount,
                           weights.date,               weights.merchant,
                           duplicate_threshold,        exact_fields_score,
                           recurring_score,            similar_description_reason_cutoff};
  for (const double score : scores) {
    if (!in_unit_interval(score)) {
      return R::err("scores, weights and thresholds must lie in [0, 1]");
    }
  }

  if (recurring_band.min_days < 1 || recurring_band.max_days < recurring_band.min_days) {
    return R::err("recurring band must satisfy 1 <= min_days <= max_days");
  }
  if (amount_tolerance.units <= 0) {
    return R::err("amount_tolerance must be positive");
  }
  if (query_margin_days < 0 || empty_batch_lookback_months < 0) {
    return R::err("query window margins must not be negative");
  }

  return R::ok(true);
}

}  // namespace txdedup::detection
