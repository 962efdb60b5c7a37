#include "txdedup/storage/audit_log.h"

namespace txdedup::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

}  // namespace txdedup::storage
