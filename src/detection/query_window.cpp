#include "txdedup/detection/query_window.h"

#include <optional>

namespace txdedup::detection {

domain::QueryWindow compute_query_window(const std::vector<domain::CandidateTransaction>& candidates,
                                         const core::Date& today, const ScoringConfig& config) {
  std::optional<core::Date> min_date;
  std::optional<core::Date> max_date;

  for (const auto& candidate : candidates) {
    if (!candidate.date.has_value()) {
      continue;
    }
    const auto& date = *candidate.date;
    if (!min_date.has_value() || date < *min_date) {
      min_date = date;
    }
    if (!max_date.has_value() || date > *max_date) {
      max_date = date;
    }
  }

  const core::Date start =
      min_date.value_or(core::subtract_months(today, config.empty_batch_lookback_months));
  const core::Date end = max_date.value_or(today);

  return domain::QueryWindow{
      .start = core::add_days(start, -config.query_margin_days),
      .end = core::add_days(end, config.query_margin_days),
  };
}

}  // namespace txdedup::detection
