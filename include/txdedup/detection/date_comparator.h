#pragma once

#include "txdedup/core/date.h"
#include "txdedup/detection/scoring_config.h"

#include <optional>

namespace txdedup::detection {

// dates_equal: two missing dates are equal, a missing date never equals a present one.
[[nodiscard]] bool dates_equal(const std::optional<core::Date>& a,
                               const std::optional<core::Date>& b);

// date_similarity buckets the day gap through config.date_tiers (first tier that fits wins).
// Both dates missing scores like a zero-day gap; one missing scores 0.0.
[[nodiscard]] double date_similarity(const std::optional<core::Date>& a,
                                     const std::optional<core::Date>& b,
                                     const ScoringConfig& config);

}  // namespace txdedup::detection
