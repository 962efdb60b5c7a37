#pragma once

#include <string>
#include <vector>

namespace txdedup::storage {

// Event types written by run_detection_pipeline, in emission order.
namespace audit_event_type {
inline constexpr const char* kDetectionStarted = "DetectionStarted";
inline constexpr const char* kPairScoringFailed = "PairScoringFailed";
inline constexpr const char* kDetectionCompleted = "DetectionCompleted";
inline constexpr const char* kDetectionFailed = "DetectionFailed";
}  // namespace audit_event_type

// One step of a detection run. payload is a compact JSON object; refs holds the
// user id or existing transaction ids the step touched.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace txdedup::storage
