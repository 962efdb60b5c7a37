#include "txdedup/storage/inmemory_transaction_repository.h"

namespace txdedup::storage {

void InMemoryTransactionRepository::upsert(const core::UserId& user_id,
                                           const domain::ExistingTransactionRecord& record) {
  records_[{user_id.value, record.transaction_id}] = record;
}

std::vector<domain::ExistingTransactionRecord>
InMemoryTransactionRepository::fetch_by_user_and_date_range(const core::UserId& user_id,
                                                            const core::Date& start,
                                                            const core::Date& end) const {
  std::vector<domain::ExistingTransactionRecord> result;
  for (auto it = records_.lower_bound({user_id.value, std::string{}});
       it != records_.end() && it->first.first == user_id.value; ++it) {
    const auto date = it->second.parsed_date();
    if (date.has_value() && *date >= start && *date <= end) {
      result.push_back(it->second);
    }
  }
  return result;
}

std::vector<domain::ExistingTransactionRecord> InMemoryTransactionRepository::list_by_user(
    const core::UserId& user_id) const {
  std::vector<domain::ExistingTransactionRecord> result;
  for (auto it = records_.lower_bound({user_id.value, std::string{}});
       it != records_.end() && it->first.first == user_id.value; ++it) {
    result.push_back(it->second);
  }
  return result;
}

}  // namespace txdedup::storage
