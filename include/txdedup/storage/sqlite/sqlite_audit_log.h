#pragma once

#include "txdedup/storage/audit_log.h"
#include "txdedup/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace txdedup::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Append-only; per-trace ordering is kept by the idx column.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  [[nodiscard]] int next_index(const std::string& trace_id);
};

}  // namespace txdedup::storage::sqlite
