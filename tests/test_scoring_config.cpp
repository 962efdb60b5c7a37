#include "txdedup/detection/scoring_config.h"
#include "txdedup/detection/scoring_config_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace txdedup;

TEST_CASE("Default scoring config holds the production thresholds", "[config]") {
  const auto config = detection::default_scoring_config();

  CHECK(config.duplicate_threshold == 0.90);
  CHECK(config.exact_fields_score == 0.95);
  CHECK(config.recurring_score == 0.30);
  CHECK(config.recurring_band.min_days == 7);
  CHECK(config.recurring_band.max_days == 60);
  CHECK(config.query_margin_days == 35);
  CHECK(config.empty_batch_lookback_months == 3);
  CHECK(config.amount_tolerance == domain::Money::from_cents(1));
  CHECK(config.validate().has_value());
}

TEST_CASE("validate rejects inconsistent configs", "[config]") {
  SECTION("threshold out of range") {
    detection::ScoringConfig config;
    config.duplicate_threshold = 1.5;
    CHECK_FALSE(config.validate().has_value());
  }

  SECTION("unordered date tiers") {
    detection::ScoringConfig config;
    config.date_tiers = {{3, 0.8}, {1, 0.9}};
    CHECK_FALSE(config.validate().has_value());
  }

  SECTION("inverted recurring band") {
    detection::ScoringConfig config;
    config.recurring_band = {.min_days = 30, .max_days = 7};
    CHECK_FALSE(config.validate().has_value());
  }

  SECTION("zero tolerance") {
    detection::ScoringConfig config;
    config.amount_tolerance = domain::Money::from_units(0);
    CHECK_FALSE(config.validate().has_value());
  }
}

TEST_CASE("scoring_config_from_json overlays present keys", "[config][json]") {
  const auto j = nlohmann::json::parse(R"({
    "duplicate_threshold": 0.85,
    "recurring_band": {"max_days": 45},
    "amount_tolerance": "0.05",
    "date_tiers": [{"max_days": 0, "score": 1.0}, {"max_days": 2, "score": 0.6}]
  })");

  const auto result = detection::scoring_config_from_json(j);
  REQUIRE(result.has_value());
  const auto& config = result.value();

  CHECK(config.duplicate_threshold == 0.85);
  CHECK(config.recurring_band.min_days == 7);
  CHECK(config.recurring_band.max_days == 45);
  CHECK(config.amount_tolerance == domain::Money::from_cents(5));
  REQUIRE(config.date_tiers.size() == 2);
  CHECK(config.date_tiers[1].score == 0.6);
  CHECK(config.exact_fields_score == 0.95);
}

TEST_CASE("scoring_config_from_json reports bad input", "[config][json]") {
  CHECK_FALSE(detection::scoring_config_from_json(nlohmann::json::array()).has_value());
  CHECK_FALSE(
      detection::scoring_config_from_json(nlohmann::json{{"duplicate_threshold", "high"}})
          .has_value());
  CHECK_FALSE(
      detection::scoring_config_from_json(nlohmann::json{{"duplicate_threshold", 2.0}})
          .has_value());
  CHECK_FALSE(
      detection::scoring_config_from_json(nlohmann::json{{"amount_tolerance", "1,00"}})
          .has_value());
  CHECK_FALSE(
      detection::scoring_config_from_json(nlohmann::json{{"amount_tolerance", 1e300}})
          .has_value());
}

TEST_CASE("scoring config survives a JSON file", "[config][json]") {
  const std::string path = "txdedup_test_scoring_config.json";
  auto config = detection::default_scoring_config();
  config.duplicate_threshold = 0.8;
  {
    std::ofstream out(path);
    out << detection::scoring_config_to_json(config).dump(2);
  }

  const auto loaded = detection::load_scoring_config(path);
  std::remove(path.c_str());

  REQUIRE(loaded.has_value());
  CHECK(loaded.value().duplicate_threshold == 0.8);
  CHECK(loaded.value().amount_tiers.size() == config.amount_tiers.size());
  CHECK(loaded.value().amount_tolerance == config.amount_tolerance);
}

TEST_CASE("load_scoring_config reports missing files", "[config][json]") {
  const auto result = detection::load_scoring_config("/nonexistent/scoring.json");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("cannot open") != std::string::npos);
}
