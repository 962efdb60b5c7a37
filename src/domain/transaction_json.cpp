#include "txdedup/domain/transaction_json.h"

namespace txdedup::domain {

namespace {

using nlohmann::json;

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) {
    return std::nullopt;
  }
  return j[key].get<std::string>();
}

core::Result<Money, std::string> amount_from_json(const json& j) {
  if (!j.contains("amount")) {
    return core::Result<Money, std::string>::err("missing field 'amount'");
  }

  const auto& amount = j["amount"];
  if (amount.is_number()) {
    const auto converted = Money::from_double(amount.get<double>());
    if (!converted.has_value()) {
      return core::Result<Money, std::string>::err("amount is out of range");
    }
    return core::Result<Money, std::string>::ok(converted.value());
  }

  if (amount.is_string()) {
    const auto text = amount.get<std::string>();
    auto parsed = parse_money(text);
    if (!parsed.has_value()) {
      return core::Result<Money, std::string>::err("invalid amount '" + text + "'");
    }
    return core::Result<Money, std::string>::ok(parsed.value());
  }

  return core::Result<Money, std::string>::err("amount must be a string or a number");
}

const json* transaction_array(const json& j) {
  if (j.is_array()) {
    return &j;
  }
  if (j.is_object() && j.contains("transactions") && j["transactions"].is_array()) {
    return &j["transactions"];
  }
  return nullptr;
}

template <typename T>
core::Result<std::vector<T>, std::string> list_from_json(
    const json& j, core::Result<T, std::string> (*parse_one)(const json&)) {
  const json* items = transaction_array(j);
  if (items == nullptr) {
    return core::Result<std::vector<T>, std::string>::err(
        "expected an array or an object with a \"transactions\" array");
  }

  std::vector<T> result;
  result.reserve(items->size());
  for (std::size_t i = 0; i < items->size(); ++i) {
    auto parsed = parse_one((*items)[i]);
    if (!parsed.has_value()) {
      return core::Result<std::vector<T>, std::string>::err("transaction " + std::to_string(i) +
                                                            ": " + parsed.error());
    }
    result.push_back(parsed.value());
  }
  return core::Result<std::vector<T>, std::string>::ok(std::move(result));
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

core::Result<CandidateTransaction, std::string> candidate_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return core::Result<CandidateTransaction, std::string>::err("expected an object");
  }

  auto amount = amount_from_json(j);
  if (!amount.has_value()) {
    return core::Result<CandidateTransaction, std::string>::err(amount.error());
  }

  CandidateTransaction candidate;
  candidate.amount = amount.value();
  if (const auto date_text = optional_string(j, "date"); date_text.has_value()) {
    candidate.date = core::parse_iso_date(*date_text);
  }
  candidate.description = optional_string(j, "description").value_or("");
  candidate.merchant_name = optional_string(j, "merchant_name");
  candidate.transaction_id = optional_string(j, "transaction_id");
  candidate.external_id = optional_string(j, "external_id");

  return core::Result<CandidateTransaction, std::string>::ok(std::move(candidate));
}

core::Result<std::vector<CandidateTransaction>, std::string> candidates_from_json(
    const nlohmann::json& j) {
  return list_from_json<CandidateTransaction>(j, &candidate_from_json);
}

core::Result<ExistingTransactionRecord, std::string> existing_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return core::Result<ExistingTransactionRecord, std::string>::err("expected an object");
  }

  const auto transaction_id = optional_string(j, "transaction_id");
  if (!transaction_id.has_value() || transaction_id->empty()) {
    return core::Result<ExistingTransactionRecord, std::string>::err(
        "missing field 'transaction_id'");
  }

  auto amount = amount_from_json(j);
  if (!amount.has_value()) {
    return core::Result<ExistingTransactionRecord, std::string>::err(amount.error());
  }

  ExistingTransactionRecord record;
  record.transaction_id = *transaction_id;
  record.date = optional_string(j, "date").value_or("");
  record.amount = amount.value();
  record.description = optional_string(j, "description").value_or("");
  record.merchant_name = optional_string(j, "merchant_name");
  record.external_id = optional_string(j, "external_id");

  return core::Result<ExistingTransactionRecord, std::string>::ok(std::move(record));
}

core::Result<std::vector<ExistingTransactionRecord>, std::string> existing_records_from_json(
    const nlohmann::json& j) {
  return list_from_json<ExistingTransactionRecord>(j, &existing_from_json);
}

nlohmann::json candidate_to_json(const CandidateTransaction& candidate) {
  json j;
  j["date"] = candidate.date.has_value() ? json(core::format_iso_date(*candidate.date)) : json();
  j["amount"] = format_money(candidate.amount);
  j["description"] = candidate.description;
  put_optional(j, "merchant_name", candidate.merchant_name);
  put_optional(j, "transaction_id", candidate.transaction_id);
  put_optional(j, "external_id", candidate.external_id);
  return j;
}

nlohmann::json existing_to_json(const ExistingTransactionRecord& record) {
  json j;
  j["transaction_id"] = record.transaction_id;
  j["date"] = record.date;
  j["amount"] = format_money(record.amount);
  j["description"] = record.description;
  put_optional(j, "merchant_name", record.merchant_name);
  put_optional(j, "external_id", record.external_id);
  return j;
}

nlohmann::json match_candidate_to_json(const MatchCandidate& match) {
  json j;
  j["existing"] = existing_to_json(match.existing);
  j["similarity_score"] = match.similarity_score;
  j["match_reasons"] = match.match_reasons;
  j["reason"] = match.reason_text();
  return j;
}

nlohmann::json detection_result_to_json(const DetectionResult& result) {
  json j;

  if (result.window.has_value()) {
    j["window"] = {{"start", core::format_iso_date(result.window->start)},
                   {"end", core::format_iso_date(result.window->end)}};
  } else {
    j["window"] = nullptr;
  }

  json skip = json::array();
  json skip_reasons = json::object();
  json matches = json::object();
  for (const auto& [index, classification] : result.classifications) {
    const std::string key = std::to_string(index);
    if (classification.kind == ClassificationKind::kSkip) {
      skip.push_back(index);
      if (classification.skip_reason.has_value()) {
        skip_reasons[key] = identity_match_kind_to_string(*classification.skip_reason);
      }
    } else if (classification.kind == ClassificationKind::kMatches) {
      json list = json::array();
      for (const auto& match : classification.matches) {
        list.push_back(match_candidate_to_json(match));
      }
      matches[key] = list;
    }
  }
  j["skip"] = skip;
  j["skip_reasons"] = skip_reasons;
  j["matches"] = matches;

  j["stats"] = {
      {"candidates", result.stats.candidates},
      {"existing_fetched", result.stats.existing_fetched},
      {"skipped", result.stats.skipped},
      {"flagged", result.stats.flagged},
      {"pairs_scored", result.stats.pairs_scored},
      {"pairs_failed", result.stats.pairs_failed},
  };

  json failures = json::array();
  for (const auto& failure : result.failures) {
    failures.push_back({{"candidate_index", failure.candidate_index},
                        {"existing_transaction_id", failure.existing_transaction_id},
                        {"message", failure.message}});
  }
  j["failures"] = failures;

  return j;
}

}  // namespace txdedup::domain
