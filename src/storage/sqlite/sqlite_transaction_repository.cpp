#include "txdedup/storage/sqlite/sqlite_transaction_repository.h"

#include <sqlite3.h>

#include <stdexcept>

namespace txdedup::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT transaction_id, transaction_date, amount_units, description, merchant_name,"
    "       external_id FROM transactions";

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, column);
}

domain::ExistingTransactionRecord read_row(sqlite3_stmt* stmt) {
  return domain::ExistingTransactionRecord{
      .transaction_id = column_text(stmt, 0),
      .date = column_text(stmt, 1),
      .amount = domain::Money::from_units(sqlite3_column_int64(stmt, 2)),
      .description = column_text(stmt, 3),
      .merchant_name = column_optional_text(stmt, 4),
      .external_id = column_optional_text(stmt, 5),
  };
}

std::vector<domain::ExistingTransactionRecord> read_all(sqlite3* db, sqlite3_stmt* stmt) {
  std::vector<domain::ExistingTransactionRecord> result;
  int rc = sqlite3_step(stmt);
  while (rc == SQLITE_ROW) {
    result.push_back(read_row(stmt));
    rc = sqlite3_step(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Transaction query failed: " + std::string{sqlite3_errmsg(db)});
  }
  return result;
}

}  // namespace

SqliteTransactionRepository::SqliteTransactionRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqliteTransactionRepository::upsert(const core::UserId& user_id,
                                         const domain::ExistingTransactionRecord& record) {
  const char* sql = R"(
    INSERT INTO transactions
      (user_id, transaction_id, transaction_date, amount_units, description, merchant_name,
       external_id)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(user_id, transaction_id) DO UPDATE SET
      transaction_date = excluded.transaction_date,
      amount_units = excluded.amount_units,
      description = excluded.description,
      merchant_name = excluded.merchant_name,
      external_id = excluded.external_id
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare transaction upsert: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, user_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, record.transaction_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, record.date.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 4, record.amount.units);
  sqlite3_bind_text(stmt.get(), 5, record.description.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional_text(stmt.get(), 6, record.merchant_name);
  bind_optional_text(stmt.get(), 7, record.external_id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("Transaction upsert failed: " +
                             std::string{sqlite3_errmsg(db_->connection())});
  }
}

std::vector<domain::ExistingTransactionRecord>
SqliteTransactionRepository::fetch_by_user_and_date_range(const core::UserId& user_id,
                                                          const core::Date& start,
                                                          const core::Date& end) const {
  // substr() drops any time-of-day suffix so timestamps on the end date still qualify.
  const std::string sql = std::string{kSelectColumns} +
                          " WHERE user_id = ? AND substr(transaction_date, 1, 10) BETWEEN ? AND ?"
                          " ORDER BY transaction_date, transaction_id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare transaction fetch: " + stmt.error());
  }

  const std::string start_text = core::format_iso_date(start);
  const std::string end_text = core::format_iso_date(end);
  sqlite3_bind_text(stmt.get(), 1, user_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, start_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, end_text.c_str(), -1, SQLITE_TRANSIENT);

  return read_all(db_->connection(), stmt.get());
}

std::vector<domain::ExistingTransactionRecord> SqliteTransactionRepository::list_by_user(
    const core::UserId& user_id) const {
  const std::string sql =
      std::string{kSelectColumns} + " WHERE user_id = ? ORDER BY transaction_id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare transaction listing: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, user_id.value.c_str(), -1, SQLITE_TRANSIENT);
  return read_all(db_->connection(), stmt.get());
}

}  // namespace txdedup::storage::sqlite
