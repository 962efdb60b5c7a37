#include "txdedup/detection/identity_filter.h"

#include "txdedup/core/normalization.h"
#include "txdedup/detection/amount_comparator.h"
#include "txdedup/detection/date_comparator.h"

namespace txdedup::detection {

FieldAgreement compare_fields(const domain::CandidateTransaction& candidate,
                              const domain::ExistingTransactionRecord& existing,
                              const ScoringConfig& config) {
  FieldAgreement agreement;
  agreement.description = core::normalize_description(candidate.description) ==
                          core::normalize_description(existing.description);
  agreement.amount = amounts_match(candidate.amount, existing.amount, config.amount_tolerance);
  agreement.date = dates_equal(candidate.date, existing.parsed_date());
  return agreement;
}

bool has_conflicting_identifier(const domain::CandidateTransaction& candidate,
                                const domain::ExistingTransactionRecord& existing) {
  if (core::has_text(candidate.transaction_id) && !existing.transaction_id.empty() &&
      !core::equals_ignore_case(*candidate.transaction_id, existing.transaction_id)) {
    return true;
  }
  return core::has_text(candidate.external_id) && core::has_text(existing.external_id) &&
         *candidate.external_id != *existing.external_id;
}

std::optional<domain::IdentityMatchKind> find_identity_match(
    const domain::CandidateTransaction& candidate,
    const domain::ExistingTransactionRecord& existing, const ScoringConfig& config) {
  if (core::has_text(candidate.transaction_id) && !existing.transaction_id.empty() &&
      core::equals_ignore_case(*candidate.transaction_id, existing.transaction_id)) {
    return domain::IdentityMatchKind::kTransactionId;
  }

  if (core::has_text(candidate.external_id) && core::has_text(existing.external_id) &&
      *candidate.external_id == *existing.external_id) {
    return domain::IdentityMatchKind::kExternalId;
  }

  if (!has_conflicting_identifier(candidate, existing) &&
      compare_fields(candidate, existing, config).all()) {
    return domain::IdentityMatchKind::kExactFields;
  }

  return std::nullopt;
}

}  // namespace txdedup::detection
