#pragma once

#include "txdedup/detection/scoring_config.h"
#include "txdedup/domain/duplicate_match.h"
#include "txdedup/domain/transaction.h"

#include <optional>

namespace txdedup::detection {

// FieldAgreement captures the three exact-equality signals shared by the identity filter,
// the scorer's short-circuit paths and the match reasons.
struct FieldAgreement {
  bool description{false};  // normalized (trimmed, case-folded) descriptions equal
  bool amount{false};       // amounts_match within tolerance, either sign convention
  bool date{false};         // dates_equal (missing == missing)

  [[nodiscard]] bool all() const { return description && amount && date; }
};

[[nodiscard]] FieldAgreement compare_fields(const domain::CandidateTransaction& candidate,
                                            const domain::ExistingTransactionRecord& existing,
                                            const ScoringConfig& config);

// has_conflicting_identifier is true when both sides carry a transaction id (or both an
// external id) and those ids differ: the source systems consider them distinct records.
[[nodiscard]] bool has_conflicting_identifier(const domain::CandidateTransaction& candidate,
                                              const domain::ExistingTransactionRecord& existing);

// find_identity_match classifies a pair as certainly the same transaction:
//   1. same non-empty transaction id (case-insensitive)
//   2. same non-empty external id (case-sensitive)
//   3. exact description + amount + date, unless the ids conflict
// Returns the first rule that fires, or nullopt.
[[nodiscard]] std::optional<domain::IdentityMatchKind> find_identity_match(
    const domain::CandidateTransaction& candidate,
    const domain::ExistingTransactionRecord& existing, const ScoringConfig& config);

}  // namespace txdedup::detection
