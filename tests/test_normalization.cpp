#include "txdedup/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace txdedup;

TEST_CASE("normalize_description trims and case-folds", "[normalization]") {
  CHECK(core::normalize_description("  Coffee SHOP\t") == "coffee shop");
  CHECK(core::normalize_description("") == "");
  CHECK(core::normalize_description("   ") == "");
  CHECK(core::normalize_description("Caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("normalize_merchant treats absent as empty", "[normalization]") {
  CHECK(core::normalize_merchant(std::nullopt) == "");
  CHECK(core::normalize_merchant(std::string{" Starbucks "}) == "starbucks");
}

TEST_CASE("equals_ignore_case folds ASCII only", "[normalization]") {
  CHECK(core::equals_ignore_case("TX-ABC-001", "tx-abc-001"));
  CHECK_FALSE(core::equals_ignore_case("TX-ABC-001", "tx-abc-002"));
  CHECK_FALSE(core::equals_ignore_case("abc", "abcd"));
}

TEST_CASE("has_text requires a non-empty value", "[normalization]") {
  CHECK_FALSE(core::has_text(std::nullopt));
  CHECK_FALSE(core::has_text(std::string{}));
  CHECK(core::has_text(std::string{"x"}));
}
