#pragma once

#include "txdedup/core/date.h"
#include "txdedup/core/ids.h"
#include "txdedup/domain/transaction.h"

#include <vector>

namespace txdedup::storage {

// ITransactionSource is the read side the detector depends on.
// fetch_by_user_and_date_range returns every transaction of the user whose date lies in
// [start, end] (inclusive). Order is not significant. Retry/timeout policy belongs here,
// not in the detector.
class ITransactionSource {
 public:
  virtual ~ITransactionSource() = default;
  [[nodiscard]] virtual std::vector<domain::ExistingTransactionRecord> fetch_by_user_and_date_range(
      const core::UserId& user_id, const core::Date& start, const core::Date& end) const = 0;
};

// ITransactionRepository adds the write side used to seed history (imports, tests).
class ITransactionRepository : public ITransactionSource {
 public:
  // upsert replaces any record with the same (user_id, transaction_id).
  virtual void upsert(const core::UserId& user_id,
                      const domain::ExistingTransactionRecord& record) = 0;
  [[nodiscard]] virtual std::vector<domain::ExistingTransactionRecord> list_by_user(
      const core::UserId& user_id) const = 0;
};

}  // namespace txdedup::storage
