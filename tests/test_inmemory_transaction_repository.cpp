#include "txdedup/storage/inmemory_transaction_repository.h"

#include "transaction_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace txdedup;
using testing::date;
using testing::existing;

TEST_CASE("InMemoryTransactionRepository upsert and list", "[storage][inmemory]") {
  storage::InMemoryTransactionRepository repo;
  const core::UserId alice{"alice"};
  const core::UserId bob{"bob"};

  repo.upsert(alice, existing("tx-2", "2024-03-02", "-2.00", "b"));
  repo.upsert(alice, existing("tx-1", "2024-03-01", "-1.00", "a"));
  repo.upsert(bob, existing("tx-1", "2024-03-01", "-9.00", "bob's"));

  const auto listed = repo.list_by_user(alice);
  REQUIRE(listed.size() == 2);
  CHECK(listed[0].transaction_id == "tx-1");
  CHECK(listed[1].transaction_id == "tx-2");

  SECTION("upsert replaces by transaction id") {
    repo.upsert(alice, existing("tx-1", "2024-03-01", "-1.50", "a"));
    const auto after = repo.list_by_user(alice);
    REQUIRE(after.size() == 2);
    CHECK(after[0].amount == testing::money("-1.50"));
  }
}

TEST_CASE("InMemoryTransactionRepository fetch is scoped and inclusive", "[storage][inmemory]") {
  storage::InMemoryTransactionRepository repo;
  const core::UserId alice{"alice"};

  repo.upsert(alice, existing("tx-before", "2024-02-29", "-1.00", "a"));
  repo.upsert(alice, existing("tx-start", "2024-03-01", "-1.00", "a"));
  repo.upsert(alice, existing("tx-end", "2024-03-31T18:00:00Z", "-1.00", "a"));
  repo.upsert(alice, existing("tx-after", "2024-04-01", "-1.00", "a"));
  repo.upsert(alice, existing("tx-undated", "unknown", "-1.00", "a"));
  repo.upsert(core::UserId{"bob"}, existing("tx-bob", "2024-03-15", "-1.00", "a"));

  const auto fetched =
      repo.fetch_by_user_and_date_range(alice, date("2024-03-01"), date("2024-03-31"));
  REQUIRE(fetched.size() == 2);
  CHECK(fetched[0].transaction_id == "tx-end");
  CHECK(fetched[1].transaction_id == "tx-start");
}
