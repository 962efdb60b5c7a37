#include "txdedup/detection/string_similarity.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <string>

using namespace txdedup;

TEST_CASE("Levenshtein distance counts unit edits", "[similarity]") {
  CHECK(detection::levenshtein_distance("", "") == 0);
  CHECK(detection::levenshtein_distance("abc", "") == 3);
  CHECK(detection::levenshtein_distance("", "abc") == 3);
  CHECK(detection::levenshtein_distance("kitten", "sitting") == 3);
  CHECK(detection::levenshtein_distance("flaw", "lawn") == 2);
  CHECK(detection::levenshtein_distance("netflix", "netflix") == 0);
}

TEST_CASE("Levenshtein distance is symmetric", "[similarity]") {
  CHECK(detection::levenshtein_distance("amazon mktp", "amazon marketplace") ==
        detection::levenshtein_distance("amazon marketplace", "amazon mktp"));
}

TEST_CASE("String similarity normalizes distance by the longer string", "[similarity]") {
  SECTION("identical strings score 1.0") {
    CHECK(detection::string_similarity("coffee shop", "coffee shop") == 1.0);
  }

  SECTION("two empty strings are identical") {
    CHECK(detection::string_similarity("", "") == 1.0);
  }

  SECTION("one empty string scores 0.0") {
    CHECK(detection::string_similarity("", "netflix") == 0.0);
    CHECK(detection::string_similarity("netflix", "") == 0.0);
  }

  SECTION("partial overlap") {
    // kitten -> sitting: 3 edits over 7 characters
    CHECK_THAT(detection::string_similarity("kitten", "sitting"),
               Catch::Matchers::WithinAbs(1.0 - 3.0 / 7.0, 1e-9));
  }

  SECTION("comparison is case-sensitive; callers normalize first") {
    CHECK(detection::string_similarity("ABC", "abc") == 0.0);
  }
}

TEST_CASE("String similarity accepts owned normalized strings", "[similarity]") {
  const std::string candidate = "coffee shop";
  const std::string existing = "coffee shop downtown";

  CHECK(detection::string_similarity(candidate, candidate) == 1.0);
  CHECK(detection::string_similarity(candidate, std::string{}) == 0.0);
  // 9 insertions over 20 characters
  CHECK_THAT(detection::string_similarity(candidate, existing),
             Catch::Matchers::WithinAbs(1.0 - 9.0 / 20.0, 1e-9));
}
