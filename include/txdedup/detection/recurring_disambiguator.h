#pragma once

#include "txdedup/core/date.h"
#include "txdedup/detection/scoring_config.h"

#include <optional>

namespace txdedup::detection {

enum class RecurrenceCadence {
  kNone,
  kWeekly,      // 7-8 days
  kBiWeekly,    // 13-15 days
  kMonthly,     // 25-31 days
  kBiMonthly,   // 56-62 days
  kIrregular,   // inside the band but no common cadence
};

[[nodiscard]] const char* recurrence_cadence_to_string(RecurrenceCadence cadence);

struct RecurrenceAssessment {
  bool recurring{false};
  std::optional<long> days_apart;  // nullopt when either date is missing
  RecurrenceCadence cadence{RecurrenceCadence::kNone};
};

// assess_recurrence decides whether an exact description+amount pair on different dates is a
// recurring charge. Recurring iff both dates are known and band.min_days <= gap <= band.max_days.
// Gaps outside the band fall through to weighted scoring.
// The cadence label is descriptive only and never changes the decision.
[[nodiscard]] RecurrenceAssessment assess_recurrence(const std::optional<core::Date>& candidate_date,
                                                     const std::optional<core::Date>& existing_date,
                                                     const RecurringBand& band);

}  // namespace txdedup::detection
