#pragma once

#include "txdedup/storage/audit_event.h"

#include <string>
#include <vector>

namespace txdedup::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // query returns the events of one trace in append order; an empty trace_id returns all.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  std::vector<AuditEvent> events_;
};

}  // namespace txdedup::storage
