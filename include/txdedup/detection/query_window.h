#pragma once

#include "txdedup/core/date.h"
#include "txdedup/detection/scoring_config.h"
#include "txdedup/domain/duplicate_match.h"
#include "txdedup/domain/transaction.h"

#include <vector>

namespace txdedup::detection {

// compute_query_window derives the date range of existing transactions to fetch.
// min/max are taken over the candidates' known dates; with no dated candidate the span falls
// back to [today - empty_batch_lookback_months, today]. The span is then widened by
// query_margin_days on both sides so recurring charges and statement-boundary stragglers
// are visible to the identity filter and the recurring check.
[[nodiscard]] domain::QueryWindow compute_query_window(
    const std::vector<domain::CandidateTransaction>& candidates, const core::Date& today,
    const ScoringConfig& config);

}  // namespace txdedup::detection
