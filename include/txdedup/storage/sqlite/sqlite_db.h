#pragma once

#include "txdedup/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace txdedup::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the schema.
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance (no sharing across threads)
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Apply all schema versions not yet present (transactions, audit events).
  [[nodiscard]] core::Result<bool, std::string> ensure_schema();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection for prepared statements; repository implementations only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  [[nodiscard]] core::Result<bool, std::string> apply_schema(int version, const char* sql);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// column_text returns "" for NULL columns.
[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int column);

}  // namespace txdedup::storage::sqlite
