#pragma once

#include "txdedup/core/clock.h"
#include "txdedup/core/id_generator.h"
#include "txdedup/core/ids.h"
#include "txdedup/core/services.h"
#include "txdedup/detection/scoring_config.h"
#include "txdedup/detection/similarity_scorer.h"
#include "txdedup/domain/duplicate_match.h"
#include "txdedup/domain/transaction.h"
#include "txdedup/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace txdedup::app {

// ────────────────────────────────────────────────────────────────
// Detection Pipeline
// ────────────────────────────────────────────────────────────────

struct DetectionPipelineRequest {
  core::UserId user_id;                                 // NOLINT(readability-identifier-naming)
  std::vector<domain::CandidateTransaction> candidates;  // NOLINT(readability-identifier-naming)

  detection::ScoringConfig config{
      detection::default_scoring_config()};  // NOLINT(readability-identifier-naming)

  // Optional replacement pair scorer (not owned); the SimilarityScorer is used when null
  const detection::IPairScorer* scorer{nullptr};  // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct DetectionPipelineResponse {
  std::string trace_id;             // NOLINT(readability-identifier-naming)
  domain::DetectionResult result;  // NOLINT(readability-identifier-naming)
};

// Run duplicate detection for one import batch.
// Emits audit events: DetectionStarted, PairScoringFailed (per isolated pair failure),
// DetectionCompleted. A failing transaction source emits DetectionFailed and the
// exception propagates to the caller.
[[nodiscard]] DetectionPipelineResponse run_detection_pipeline(const DetectionPipelineRequest& req,
                                                               core::Services& services,
                                                               core::IIdGenerator& id_gen,
                                                               core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace txdedup::app
