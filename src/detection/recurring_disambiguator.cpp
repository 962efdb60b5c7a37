#include "txdedup/detection/recurring_disambiguator.h"

namespace txdedup::detection {

namespace {

RecurrenceCadence cadence_for(long days) {
  if (days >= 7 && days <= 8) {
    return RecurrenceCadence::kWeekly;
  }
  if (days >= 13 && days <= 15) {
    return RecurrenceCadence::kBiWeekly;
  }
  if (days >= 25 && days <= 31) {
    return RecurrenceCadence::kMonthly;
  }
  if (days >= 56 && days <= 62) {
    return RecurrenceCadence::kBiMonthly;
  }
  return RecurrenceCadence::kIrregular;
}

}  // namespace

const char* recurrence_cadence_to_string(RecurrenceCadence cadence) {
  switch (cadence) {
    case RecurrenceCadence::kNone:
      return "none";
    case RecurrenceCadence::kWeekly:
      return "weekly";
    case RecurrenceCadence::kBiWeekly:
      return "bi-weekly";
    case RecurrenceCadence::kMonthly:
      return "monthly";
    case RecurrenceCadence::kBiMonthly:
      return "bi-monthly";
    case RecurrenceCadence::kIrregular:
      return "irregular";
  }
  return "unknown";
}

RecurrenceAssessment assess_recurrence(const std::optional<core::Date>& candidate_date,
                                       const std::optional<core::Date>& existing_date,
                                       const RecurringBand& band) {
  RecurrenceAssessment assessment;
  if (!candidate_date.has_value() || !existing_date.has_value()) {
    return assessment;
  }

  const long days = core::days_between(*candidate_date, *existing_date);
  assessment.days_apart = days;
  if (days >= band.min_days && days <= band.max_days) {
    assessment.recurring = true;
    assessment.cadence = cadence_for(days);
  }
  return assessment;
}

}  // namespace txdedup::detection
