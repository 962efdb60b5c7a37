#include "detect_logic.h"

#include "txdedup/domain/transaction_json.h"
#include "txdedup/storage/audit_event.h"

#include <nlohmann/json.hpp>

int execute_detect(const txdedup::app::DetectionPipelineRequest& req,
                   txdedup::core::Services& services, txdedup::core::IIdGenerator& id_gen,
                   txdedup::core::IClock& clock, bool show_trace, std::ostream& out) {
  const auto response = txdedup::app::run_detection_pipeline(req, services, id_gen, clock);

  nlohmann::json report = txdedup::domain::detection_result_to_json(response.result);
  report["trace_id"] = response.trace_id;
  report["user_id"] = req.user_id.value;

  if (show_trace) {
    nlohmann::json trace = nlohmann::json::array();
    for (const auto& event : txdedup::app::fetch_audit_trace(response.trace_id, services)) {
      const auto payload = nlohmann::json::parse(event.payload, nullptr, false);
      trace.push_back({
          {"event_id", event.event_id},
          {"event_type", event.event_type},
          {"created_at", event.created_at},
          {"payload", payload.is_discarded() ? nlohmann::json(event.payload) : payload},
          {"refs", event.refs},
      });
    }
    report["trace"] = trace;
  }

  out << report.dump(2) << "\n";
  return 0;
}
