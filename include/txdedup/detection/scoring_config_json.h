#pragma once

#include "txdedup/core/result.h"
#include "txdedup/detection/scoring_config.h"

#include <nlohmann/json.hpp>

#include <string>

namespace txdedup::detection {

// scoring_config_from_json overlays the keys present in `j` on the production defaults.
// Recognised keys mirror the ScoringConfig field names; tier lists replace the default list
// wholesale. The merged config must pass ScoringConfig::validate().
[[nodiscard]] core::Result<ScoringConfig, std::string> scoring_config_from_json(
    const nlohmann::json& j);

// load_scoring_config reads and parses a JSON file; meant to run once at startup.
[[nodiscard]] core::Result<ScoringConfig, std::string> load_scoring_config(const std::string& path);

[[nodiscard]] nlohmann::json scoring_config_to_json(const ScoringConfig& config);

}  // namespace txdedup::detection
