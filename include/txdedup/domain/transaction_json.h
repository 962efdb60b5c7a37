#pragma once

#include "txdedup/core/result.h"
#include "txdedup/domain/duplicate_match.h"
#include "txdedup/domain/transaction.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace txdedup::domain {

// JSON field names follow the import file format:
//   {"date": "2024-01-15", "amount": "-42.50", "description": "...",
//    "merchant_name": "...", "transaction_id": "...", "external_id": "..."}
// amount may be a decimal string or a JSON number. A missing or unparsable date
// becomes null; a missing or unparsable amount is an error.

[[nodiscard]] core::Result<CandidateTransaction, std::string> candidate_from_json(
    const nlohmann::json& j);

// Accepts a bare array or an object with a "transactions" array.
[[nodiscard]] core::Result<std::vector<CandidateTransaction>, std::string> candidates_from_json(
    const nlohmann::json& j);

// Existing records require a non-empty transaction_id; the date text is kept as given.
[[nodiscard]] core::Result<ExistingTransactionRecord, std::string> existing_from_json(
    const nlohmann::json& j);

[[nodiscard]] core::Result<std::vector<ExistingTransactionRecord>, std::string>
existing_records_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json candidate_to_json(const CandidateTransaction& candidate);
[[nodiscard]] nlohmann::json existing_to_json(const ExistingTransactionRecord& record);
[[nodiscard]] nlohmann::json match_candidate_to_json(const MatchCandidate& match);

/// Serialize a detection result:
/// {"window": {...}, "skip": [indices], "matches": {"<index>": [...]}, "stats": {...},
///  "failures": [...]}
[[nodiscard]] nlohmann::json detection_result_to_json(const DetectionResult& result);

}  // namespace txdedup::domain
