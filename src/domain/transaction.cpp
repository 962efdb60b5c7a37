#include "txdedup/domain/transaction.h"

namespace txdedup::domain {

std::optional<core::Date> ExistingTransactionRecord::parsed_date() const {
  return core::parse_iso_date(date);
}

}  // namespace txdedup::domain
