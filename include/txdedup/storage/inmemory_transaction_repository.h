#pragma once

#include "txdedup/storage/repositories.h"

#include <map>
#include <string>
#include <utility>

namespace txdedup::storage {

// InMemoryTransactionRepository keeps records in a std::map keyed by (user_id, transaction_id),
// so iteration order is deterministic. Records whose date text does not parse are stored
// but never returned by a date-range fetch.
class InMemoryTransactionRepository final : public ITransactionRepository {
 public:
  void upsert(const core::UserId& user_id,
              const domain::ExistingTransactionRecord& record) override;
  [[nodiscard]] std::vector<domain::ExistingTransactionRecord> fetch_by_user_and_date_range(
      const core::UserId& user_id, const core::Date& start,
      const core::Date& end) const override;
  [[nodiscard]] std::vector<domain::ExistingTransactionRecord> list_by_user(
      const core::UserId& user_id) const override;

 private:
  std::map<std::pair<std::string, std::string>, domain::ExistingTransactionRecord> records_;
};

}  // namespace txdedup::storage
