#pragma once

#include "txdedup/core/result.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace txdedup::apps {

// read_json_file loads a whole JSON document; "-" reads standard input.
inline core::Result<nlohmann::json, std::string> read_json_file(const std::string& path) {
  using R = core::Result<nlohmann::json, std::string>;

  nlohmann::json j;
  if (path == "-") {
    j = nlohmann::json::parse(std::cin, nullptr, false);
  } else {
    std::ifstream file(path);
    if (!file) {
      return R::err("cannot open " + path);
    }
    j = nlohmann::json::parse(file, nullptr, false);
  }

  if (j.is_discarded()) {
    return R::err("not valid JSON: " + path);
  }
  return R::ok(std::move(j));
}

}  // namespace txdedup::apps
