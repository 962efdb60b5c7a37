#include "txdedup/storage/sqlite/sqlite_db.h"

#include "txdedup/core/version.h"

#include <sqlite3.h>

namespace txdedup::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

namespace {

// Schema v1: transaction history. Dates are ISO text so range queries compare lexically.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS transactions (
  user_id TEXT NOT NULL,
  transaction_id TEXT NOT NULL,
  transaction_date TEXT NOT NULL,
  amount_units INTEGER NOT NULL,
  description TEXT NOT NULL,
  merchant_name TEXT,
  external_id TEXT,
  PRIMARY KEY (user_id, transaction_id)
);

CREATE INDEX IF NOT EXISTS idx_transactions_user_date
  ON transactions(user_id, transaction_date);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

// Schema v2: audit events of detection runs
constexpr const char* kSchemaV2 = R"(
CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (2, datetime('now'));
)";

}  // namespace

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1";
  PreparedStatement stmt(db_.get(), sql);
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::apply_schema(int version, const char* sql) {
  if (get_schema_version() >= version) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v" +
                                                std::to_string(version) + ": " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::ensure_schema() {
  auto v1_result = apply_schema(1, kSchemaV1);
  if (!v1_result.has_value()) {
    return v1_result;
  }
  return apply_schema(core::kSchemaVersion, kSchemaV2);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

std::string column_text(sqlite3_stmt* stmt, int column) {
  const unsigned char* raw = sqlite3_column_text(stmt, column);
  if (raw == nullptr) {
    return std::string{};
  }
  return std::string{reinterpret_cast<const char*>(raw)};  // NOLINT
}

}  // namespace txdedup::storage::sqlite
