#pragma once

#include "txdedup/core/date.h"
#include "txdedup/domain/money.h"

#include <optional>
#include <string>

namespace txdedup::domain {

// CandidateTransaction is a newly imported or synced transaction that has not yet been
// confirmed against the user's history. Produced by the import pipeline.
// - date: null when the source value was missing or unparsable
// - transaction_id: local identifier assigned by the importer (optional)
// - external_id: identifier from the source system, e.g. an aggregator transaction id (optional)
struct CandidateTransaction {
  std::optional<core::Date> date;
  Money amount;
  std::string description;
  std::optional<std::string> merchant_name;
  std::optional<std::string> transaction_id;
  std::optional<std::string> external_id;
};

// ExistingTransactionRecord is a snapshot of a persisted transaction.
// The date is kept as stored (ISO text) and parsed on demand.
struct ExistingTransactionRecord {
  std::string transaction_id;
  std::string date;
  Money amount;
  std::string description;
  std::optional<std::string> merchant_name;
  std::optional<std::string> external_id;

  // parsed_date returns nullopt when the stored text is empty or not an ISO date.
  [[nodiscard]] std::optional<core::Date> parsed_date() const;
};

}  // namespace txdedup::domain
