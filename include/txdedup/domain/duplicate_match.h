#pragma once

#include "txdedup/core/date.h"
#include "txdedup/domain/transaction.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace txdedup::domain {

// IdentityMatchKind names the rule that proved a candidate is already present.
enum class IdentityMatchKind {
  kTransactionId,  // same local transaction id (case-insensitive)
  kExternalId,     // same source-system id (case-sensitive)
  kExactFields,    // same normalized description, amount and date
};

[[nodiscard]] const char* identity_match_kind_to_string(IdentityMatchKind kind);

// MatchCandidate is one existing record that scored at or above the duplicate threshold.
struct MatchCandidate {
  ExistingTransactionRecord existing;
  double similarity_score{0.0};             // always in [0, 1]
  std::vector<std::string> match_reasons;  // e.g. "same amount", "same date"

  // reason_text joins the reasons with ", " ("same amount, same date").
  [[nodiscard]] std::string reason_text() const;
};

enum class ClassificationKind {
  kNoMatch,  // no identity match and nothing scored above threshold: import normally
  kSkip,     // certain duplicate: suppress from import without asking
  kMatches,  // probable duplicates: surface for user review
};

[[nodiscard]] const char* classification_kind_to_string(ClassificationKind kind);

// Classification is the per-candidate outcome.
// - kSkip carries the identity rule that fired and an empty match list
// - kMatches carries a non-empty list sorted by similarity_score descending
struct Classification {
  ClassificationKind kind{ClassificationKind::kNoMatch};
  std::optional<IdentityMatchKind> skip_reason;
  std::vector<MatchCandidate> matches;

  [[nodiscard]] static Classification no_match() { return Classification{}; }
  [[nodiscard]] static Classification skip(IdentityMatchKind reason) {
    return Classification{ClassificationKind::kSkip, reason, {}};
  }
  [[nodiscard]] static Classification with_matches(std::vector<MatchCandidate> matches) {
    return Classification{ClassificationKind::kMatches, std::nullopt, std::move(matches)};
  }
};

// QueryWindow is the closed date interval handed to the transaction source.
struct QueryWindow {
  core::Date start;
  core::Date end;
};

// PairFailure records a (candidate, existing) comparison that threw and was skipped.
struct PairFailure {
  std::size_t candidate_index{0};
  std::string existing_transaction_id;
  std::string message;
};

struct DetectionStats {
  std::size_t candidates{0};
  std::size_t existing_fetched{0};
  std::size_t skipped{0};
  std::size_t flagged{0};
  std::size_t pairs_scored{0};
  std::size_t pairs_failed{0};
};

// DetectionResult holds the outcome of one detection run.
// Invariant: classifications only contains kSkip and kMatches entries; an absent index is kNoMatch.
struct DetectionResult {
  std::optional<QueryWindow> window;  // nullopt when the batch was empty and nothing was fetched
  std::map<std::size_t, Classification> classifications;
  DetectionStats stats;
  std::vector<PairFailure> failures;

  [[nodiscard]] Classification classification_for(std::size_t index) const;

  // to_match_lists produces the list-encoded shape: absent key = no match,
  // empty list = certain duplicate, non-empty list = probable duplicates.
  [[nodiscard]] std::map<std::size_t, std::vector<MatchCandidate>> to_match_lists() const;
};

}  // namespace txdedup::domain
