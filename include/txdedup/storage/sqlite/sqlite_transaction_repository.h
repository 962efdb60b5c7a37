#pragma once

#include "txdedup/storage/repositories.h"
#include "txdedup/storage/sqlite/sqlite_db.h"

#include <memory>

namespace txdedup::storage::sqlite {

// SqliteTransactionRepository implements ITransactionRepository with SQLite backend.
// Amounts are stored as integer Money units, dates as ISO text so that
// BETWEEN on the text column is a calendar range. Statement failures throw
// std::runtime_error: an unreadable history must not look like an empty one.
class SqliteTransactionRepository final : public ITransactionRepository {
 public:
  explicit SqliteTransactionRepository(std::shared_ptr<SqliteDb> db);

  void upsert(const core::UserId& user_id,
              const domain::ExistingTransactionRecord& record) override;
  [[nodiscard]] std::vector<domain::ExistingTransactionRecord> fetch_by_user_and_date_range(
      const core::UserId& user_id, const core::Date& start,
      const core::Date& end) const override;
  [[nodiscard]] std::vector<domain::ExistingTransactionRecord> list_by_user(
      const core::UserId& user_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace txdedup::storage::sqlite
