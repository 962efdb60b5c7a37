#pragma once

#include "txdedup/detection/scoring_config.h"
#include "txdedup/domain/money.h"

#include <optional>

namespace txdedup::detection {

// amounts_match is true when the amounts are equal within `tolerance`, either directly
// (|a - b|) or under a flipped sign convention between sources (|a + b|). Strict bound.
[[nodiscard]] bool amounts_match(domain::Money a, domain::Money b, domain::Money tolerance);

// percent_difference is |a - b| relative to the average magnitude.
// The average is rounded half-up to cents and the ratio half-up to four places.
// Returns nullopt when the rounded average is zero.
[[nodiscard]] std::optional<double> percent_difference(domain::Money a, domain::Money b);

// amount_similarity scores two amounts in [0, 1] using config.amount_tiers.
// Opposite signs (zero counts as positive) score config.opposite_sign_amount_score.
[[nodiscard]] double amount_similarity(domain::Money a, domain::Money b,
                                       const ScoringConfig& config);

}  // namespace txdedup::detection
