#include "txdedup/detection/scoring_config_json.h"

#include <fstream>
#include <stdexcept>

namespace txdedup::detection {

namespace {

using nlohmann::json;
using R = core::Result<ScoringConfig, std::string>;

template <typename T>
void read_if_present(const json& j, const char* key, T& target) {
  if (j.contains(key)) {
    target = j.at(key).get<T>();
  }
}

void read_tolerance(const json& j, ScoringConfig& config) {
  if (!j.contains("amount_tolerance")) {
    return;
  }
  const auto& value = j.at("amount_tolerance");
  if (value.is_string()) {
    auto parsed = domain::parse_money(value.get<std::string>());
    if (!parsed.has_value()) {
      throw std::invalid_argument("amount_tolerance is not a decimal amount");
    }
    config.amount_tolerance = parsed.value();
  } else {
    auto converted = domain::Money::from_double(value.get<double>());
    if (!converted.has_value()) {
      throw std::invalid_argument("amount_tolerance is out of range");
    }
    config.amount_tolerance = converted.value();
  }
}

}  // namespace

core::Result<ScoringConfig, std::string> scoring_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return R::err("scoring config must be a JSON object");
  }

  ScoringConfig config = default_scoring_config();

  try {
    if (j.contains("amount_tiers")) {
      config.amount_tiers.clear();
      for (const auto& tier : j.at("amount_tiers")) {
        config.amount_tiers.push_back(AmountTier{
            .max_percent_diff = tier.at("max_percent_diff").get<double>(),
            .score = tier.at("score").get<double>(),
        });
      }
    }
    read_if_present(j, "opposite_sign_amount_score", config.opposite_sign_amount_score);

    if (j.contains("date_tiers")) {
      config.date_tiers.clear();
      for (const auto& tier : j.at("date_tiers")) {
        config.date_tiers.push_back(DateTier{
            .max_days = tier.at("max_days").get<long>(),
            .score = tier.at("score").get<double>(),
        });
      }
    }
    read_if_present(j, "date_score_beyond_tiers", config.date_score_beyond_tiers);

    if (j.contains("description_weight_tiers")) {
      config.description_weight_tiers.clear();
      for (const auto& tier : j.at("description_weight_tiers")) {
        config.description_weight_tiers.push_back(DescriptionWeightTier{
            .min_similarity = tier.at("min_similarity").get<double>(),
            .weight = tier.at("weight").get<double>(),
        });
      }
    }
    read_if_present(j, "description_weight_floor", config.description_weight_floor);

    if (j.contains("weights")) {
      const auto& weights = j.at("weights");
      read_if_present(weights, "amount", config.weights.amount);
      read_if_present(weights, "date", config.weights.date);
      read_if_present(weights, "merchant", config.weights.merchant);
    }

    read_if_present(j, "duplicate_threshold", config.duplicate_threshold);
    read_if_present(j, "exact_fields_score", config.exact_fields_score);
    read_if_present(j, "recurring_score", config.recurring_score);

    if (j.contains("recurring_band")) {
      const auto& band = j.at("recurring_band");
      read_if_present(band, "min_days", config.recurring_band.min_days);
      read_if_present(band, "max_days", config.recurring_band.max_days);
    }

    read_tolerance(j, config);
    read_if_present(j, "similar_description_reason_cutoff",
                    config.similar_description_reason_cutoff);
    read_if_present(j, "query_margin_days", config.query_margin_days);
    read_if_present(j, "empty_batch_lookback_months", config.empty_batch_lookback_months);
  } catch (const json::exception& e) {
    return R::err(std::string{"invalid scoring config: "} + e.what());
  } catch (const std::invalid_argument& e) {
    return R::err(std::string{"invalid scoring config: "} + e.what());
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return R::err("invalid scoring config: " + valid.error());
  }

  return R::ok(std::move(config));
}

core::Result<ScoringConfig, std::string> load_scoring_config(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return R::err("cannot open scoring config: " + path);
  }

  const json j = json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    return R::err("scoring config is not valid JSON: " + path);
  }

  return scoring_config_from_json(j);
}

nlohmann::json scoring_config_to_json(const ScoringConfig& config) {
  json j;

  json amount_tiers = json::array();
  for (const auto& tier : config.amount_tiers) {
    amount_tiers.push_back({{"max_percent_diff", tier.max_percent_diff}, {"score", tier.score}});
  }
  j["amount_tiers"] = amount_tiers;
  j["opposite_sign_amount_score"] = config.opposite_sign_amount_score;

  json date_tiers = json::array();
  for (const auto& tier : config.date_tiers) {
    date_tiers.push_back({{"max_days", tier.max_days}, {"score", tier.score}});
  }
  j["date_tiers"] = date_tiers;
  j["date_score_beyond_tiers"] = config.date_score_beyond_tiers;

  json description_tiers = json::array();
  for (const auto& tier : config.description_weight_tiers) {
    description_tiers.push_back(
        {{"min_similarity", tier.min_similarity}, {"weight", tier.weight}});
  }
  j["description_weight_tiers"] = description_tiers;
  j["description_weight_floor"] = config.description_weight_floor;

  j["weights"] = {{"amount", config.weights.amount},
                  {"date", config.weights.date},
                  {"merchant", config.weights.merchant}};
  j["duplicate_threshold"] = config.duplicate_threshold;
  j["exact_fields_score"] = config.exact_fields_score;
  j["recurring_score"] = config.recurring_score;
  j["recurring_band"] = {{"min_days", config.recurring_band.min_days},
                         {"max_days", config.recurring_band.max_days}};
  j["amount_tolerance"] = domain::format_money(config.amount_tolerance);
  j["similar_description_reason_cutoff"] = config.similar_description_reason_cutoff;
  j["query_margin_days"] = config.query_margin_days;
  j["empty_batch_lookback_months"] = config.empty_batch_lookback_months;

  return j;
}

}  // namespace txdedup::detection
