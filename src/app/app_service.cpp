#include "txdedup/app/app_service.h"

#include "txdedup/core/version.h"
#include "txdedup/detection/duplicate_detector.h"

#include <nlohmann/json.hpp>

#include <exception>

namespace txdedup::app {

DetectionPipelineResponse run_detection_pipeline(const DetectionPipelineRequest& req,
                                                 core::Services& services,
                                                 core::IIdGenerator& id_gen, core::IClock& clock) {
  // Generate or use provided trace_id
  const std::string trace_id = req.trace_id.value_or(core::new_trace_id(id_gen).value);

  const nlohmann::json started = {
      {"user_id", req.user_id.value},
      {"candidate_count", req.candidates.size()},
      {"duplicate_threshold", req.config.duplicate_threshold},
      {"engine_version", core::kEngineVersion},
  };
  services.audit_log.append({id_gen.next("evt"),
                             trace_id,
                             storage::audit_event_type::kDetectionStarted,
                             started.dump(),
                             clock.now_iso8601(),
                             {req.user_id.value}});

  const detection::DuplicateDetector detector(services.transactions, clock, req.config,
                                              req.scorer);

  domain::DetectionResult result;
  try {
    result = detector.detect(req.user_id, req.candidates);
  } catch (const std::exception& e) {
    const nlohmann::json failed = {{"error", e.what()}};
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               storage::audit_event_type::kDetectionFailed,
                               failed.dump(),
                               clock.now_iso8601(),
                               {req.user_id.value}});
    throw;
  }

  for (const auto& failure : result.failures) {
    const nlohmann::json payload = {
        {"candidate_index", failure.candidate_index},
        {"existing_transaction_id", failure.existing_transaction_id},
        {"error", failure.message},
    };
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               storage::audit_event_type::kPairScoringFailed,
                               payload.dump(),
                               clock.now_iso8601(),
                               {failure.existing_transaction_id}});
  }

  nlohmann::json completed = {
      {"candidates", result.stats.candidates},
      {"existing_fetched", result.stats.existing_fetched},
      {"skipped", result.stats.skipped},
      {"flagged", result.stats.flagged},
      {"pairs_scored", result.stats.pairs_scored},
      {"pairs_failed", result.stats.pairs_failed},
  };
  if (result.window.has_value()) {
    completed["window_start"] = core::format_iso_date(result.window->start);
    completed["window_end"] = core::format_iso_date(result.window->end);
  }
  services.audit_log.append({id_gen.next("evt"),
                             trace_id,
                             storage::audit_event_type::kDetectionCompleted,
                             completed.dump(),
                             clock.now_iso8601(),
                             {req.user_id.value}});

  return DetectionPipelineResponse{
      .trace_id = trace_id,
      .result = std::move(result),
  };
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace txdedup::app
