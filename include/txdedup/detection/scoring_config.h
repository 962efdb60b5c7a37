#pragma once

#include "txdedup/core/result.h"
#include "txdedup/domain/money.h"

#include <string>
#include <vector>

namespace txdedup::detection {

// AmountTier: relative difference strictly below max_percent_diff scores `score`.
struct AmountTier {
  double max_percent_diff{0.0};
  double score{0.0};
};

// DateTier: a gap of at most max_days scores `score`.
struct DateTier {
  long max_days{0};
  double score{0.0};
};

// DescriptionWeightTier: a description similarity of at least min_similarity
// contributes with `weight`. Only near-exact text carries real weight.
struct DescriptionWeightTier {
  double min_similarity{0.0};
  double weight{0.0};
};

struct ComponentWeights {
  double amount{0.30};
  double date{0.20};
  double merchant{0.20};
};

// RecurringBand: exact description+amount pairs this many days apart are treated as a
// recurring charge (weekly through bi-monthly), not a duplicate.
struct RecurringBand {
  long min_days{7};
  long max_days{60};
};

// ScoringConfig holds every threshold of the duplicate model as named, immutable data.
// Tiers are ordered tables evaluated first-match-wins.
struct ScoringConfig {
  std::vector<AmountTier> amount_tiers{
      {0.001, 1.0},
      {0.005, 0.9},
      {0.01, 0.7},
      {0.05, 0.5},
  };
  // Charge vs refund/reversal: capped, never a duplicate signal on its own
  double opposite_sign_amount_score{0.3};

  std::vector<DateTier> date_tiers{
      {0, 1.0},
      {1, 0.9},
      {3, 0.8},
      {7, 0.5},
      {30, 0.3},
  };
  double date_score_beyond_tiers{0.0};

  std::vector<DescriptionWeightTier> description_weight_tiers{
      {0.95, 0.30},
      {0.50, 0.05},
  };
  double description_weight_floor{0.01};

  ComponentWeights weights{};

  double duplicate_threshold{0.90};
  double exact_fields_score{0.95};
  double recurring_score{0.30};
  RecurringBand recurring_band{};

  // Amounts within this absolute tolerance (direct difference or sum) are "the same"
  domain::Money amount_tolerance{domain::Money::from_cents(1)};

  // Similarity above which differing descriptions are reported as "similar description"
  double similar_description_reason_cutoff{0.8};

  long query_margin_days{35};
  int empty_batch_lookback_months{3};

  // validate checks ranges and tier ordering.
  // Returns ok(true) if usable, err(message) otherwise.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

[[nodiscard]] inline ScoringConfig default_scoring_config() {
  return ScoringConfig{};
}

}  // namespace txdedup::detection
