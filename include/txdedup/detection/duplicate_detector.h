#pragma once

#include "txdedup/core/clock.h"
#include "txdedup/core/ids.h"
#include "txdedup/detection/scoring_config.h"
#include "txdedup/detection/similarity_scorer.h"
#include "txdedup/domain/duplicate_match.h"
#include "txdedup/domain/transaction.h"
#include "txdedup/storage/repositories.h"

#include <cstddef>
#include <map>
#include <vector>

namespace txdedup::detection {

// DuplicateDetector classifies a batch of candidate transactions against the user's history.
//
// detect() performs exactly one read from the transaction source (none for an empty batch),
// then compares every candidate with every fetched record:
//   - the first identity match marks the candidate kSkip and ends its scan
//   - otherwise all records are scored; those at or above the duplicate threshold become
//     kMatches, sorted by score descending (ties keep fetch order)
//   - a candidate with neither is absent from the result (kNoMatch)
// A pair whose scoring throws is recorded in DetectionResult::failures and skipped.
//
// The detector holds no mutable state; detect() is const and may run concurrently
// when the source is thread-safe.
class DuplicateDetector {
 public:
  // scorer: optional replacement for the built-in SimilarityScorer (not owned).
  DuplicateDetector(const storage::ITransactionSource& source, core::IClock& clock,
                    ScoringConfig config = default_scoring_config(),
                    const IPairScorer* scorer = nullptr);
  ~DuplicateDetector() = default;

  // Not copyable or movable: scorer_ may point at default_scorer_
  DuplicateDetector(const DuplicateDetector&) = delete;
  DuplicateDetector& operator=(const DuplicateDetector&) = delete;
  DuplicateDetector(DuplicateDetector&&) = delete;
  DuplicateDetector& operator=(DuplicateDetector&&) = delete;

  [[nodiscard]] domain::DetectionResult detect(
      const core::UserId& user_id,
      const std::vector<domain::CandidateTransaction>& candidates) const;

  // detect_duplicates returns the list-encoded shape (see DetectionResult::to_match_lists).
  [[nodiscard]] std::map<std::size_t, std::vector<domain::MatchCandidate>> detect_duplicates(
      const core::UserId& user_id,
      const std::vector<domain::CandidateTransaction>& candidates) const;

  // classify_batch is the pure comparison stage over an already fetched snapshot.
  [[nodiscard]] domain::DetectionResult classify_batch(
      const std::vector<domain::CandidateTransaction>& candidates,
      const std::vector<domain::ExistingTransactionRecord>& existing) const;

  [[nodiscard]] const ScoringConfig& config() const { return config_; }

 private:
  const storage::ITransactionSource& source_;
  core::IClock& clock_;
  ScoringConfig config_;
  SimilarityScorer default_scorer_;
  const IPairScorer* scorer_;

  [[nodiscard]] domain::Classification classify_candidate(
      std::size_t index, const domain::CandidateTransaction& candidate,
      const std::vector<domain::ExistingTransactionRecord>& existing,
      domain::DetectionResult& result) const;
};

}  // namespace txdedup::detection
