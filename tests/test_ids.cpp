#include "txdedup/core/id_generator.h"
#include "txdedup/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("ID generators produce non-empty values", "[ids]") {
  SECTION("SystemIdGenerator produces unique prefixed IDs") {
    txdedup::core::SystemIdGenerator gen;
    const auto first = txdedup::core::new_trace_id(gen);
    const auto second = txdedup::core::new_trace_id(gen);

    REQUIRE_FALSE(first.value.empty());
    CHECK(first.value.rfind("trace-", 0) == 0);
    CHECK(first != second);
  }

  SECTION("DeterministicIdGenerator repeats its sequence") {
    txdedup::core::DeterministicIdGenerator gen_a;
    txdedup::core::DeterministicIdGenerator gen_b;

    CHECK(txdedup::core::new_trace_id(gen_a).value == "trace-0");
    CHECK(gen_a.next("evt") == "evt-1");
    CHECK(txdedup::core::new_trace_id(gen_b).value == "trace-0");
  }
}
