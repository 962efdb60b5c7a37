#pragma once

#include "txdedup/storage/audit_log.h"
#include "txdedup/storage/repositories.h"

namespace txdedup::core {

// Services is the composition root for a detection run.
// It holds references (not ownership) to the transaction source and the audit log;
// entry points create the concrete instances and manage their lifetimes.
struct Services {
  storage::ITransactionSource& transactions;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;              // NOLINT(readability-identifier-naming)

  Services(storage::ITransactionSource& transactions, storage::IAuditLog& audit_log)
      : transactions(transactions), audit_log(audit_log) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace txdedup::core
