#include "txdedup/core/version.h"
#include "txdedup/storage/sqlite/sqlite_db.h"
#include "txdedup/storage/sqlite/sqlite_transaction_repository.h"

#include "transaction_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace txdedup;
using testing::date;
using testing::existing;

TEST_CASE("SqliteDb applies the schema once", "[sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema().has_value());
  CHECK(db->get_schema_version() == core::kSchemaVersion);
  REQUIRE(db->ensure_schema().has_value());
  CHECK(db->get_schema_version() == core::kSchemaVersion);
}

TEST_CASE("SqliteTransactionRepository round-trips records", "[sqlite][storage]") {
  auto db = storage::sqlite::SqliteDb::open(":memory:").value();
  REQUIRE(db->ensure_schema().has_value());
  storage::sqlite::SqliteTransactionRepository repo(db);
  const core::UserId alice{"alice"};

  auto record = existing("tx-1", "2024-03-01", "-42.505", "Coffee Shop");
  record.merchant_name = "Blue Bottle";
  record.external_id = "bank-1";
  repo.upsert(alice, record);
  repo.upsert(alice, existing("tx-2", "2024-03-05", "15.99", "Refund"));

  const auto listed = repo.list_by_user(alice);
  REQUIRE(listed.size() == 2);
  CHECK(listed[0].transaction_id == "tx-1");
  CHECK(listed[0].amount == testing::money("-42.505"));
  CHECK(listed[0].merchant_name == std::optional<std::string>{"Blue Bottle"});
  CHECK(listed[0].external_id == std::optional<std::string>{"bank-1"});
  CHECK_FALSE(listed[1].merchant_name.has_value());
  CHECK_FALSE(listed[1].external_id.has_value());

  SECTION("upsert replaces an existing transaction id") {
    repo.upsert(alice, existing("tx-1", "2024-03-02", "-40.00", "Coffee Shop"));
    const auto after = repo.list_by_user(alice);
    REQUIRE(after.size() == 2);
    CHECK(after[0].date == "2024-03-02");
    CHECK_FALSE(after[0].merchant_name.has_value());
  }
}

TEST_CASE("SqliteTransactionRepository fetch honours user and inclusive range",
          "[sqlite][storage]") {
  auto db = storage::sqlite::SqliteDb::open(":memory:").value();
  REQUIRE(db->ensure_schema().has_value());
  storage::sqlite::SqliteTransactionRepository repo(db);
  const core::UserId alice{"alice"};

  repo.upsert(alice, existing("tx-before", "2024-02-29", "-1.00", "a"));
  repo.upsert(alice, existing("tx-start", "2024-03-01", "-1.00", "a"));
  repo.upsert(alice, existing("tx-end", "2024-03-31T18:00:00Z", "-1.00", "a"));
  repo.upsert(alice, existing("tx-after", "2024-04-01", "-1.00", "a"));
  repo.upsert(core::UserId{"bob"}, existing("tx-bob", "2024-03-15", "-1.00", "a"));

  const auto fetched =
      repo.fetch_by_user_and_date_range(alice, date("2024-03-01"), date("2024-03-31"));
  REQUIRE(fetched.size() == 2);
  CHECK(fetched[0].transaction_id == "tx-start");
  CHECK(fetched[1].transaction_id == "tx-end");
}

TEST_CASE("SqliteTransactionRepository surfaces query failures", "[sqlite][storage]") {
  auto db = storage::sqlite::SqliteDb::open(":memory:").value();
  storage::sqlite::SqliteTransactionRepository repo(db);

  // No schema applied: the table does not exist
  CHECK_THROWS_AS(repo.fetch_by_user_and_date_range(core::UserId{"alice"}, date("2024-01-01"),
                                                    date("2024-12-31")),
                  std::runtime_error);
  CHECK_THROWS_AS(repo.upsert(core::UserId{"alice"}, existing("tx-1", "2024-01-01", "-1.00", "a")),
                  std::runtime_error);
}
