#include "txdedup/core/clock.h"
#include "txdedup/detection/duplicate_detector.h"
#include "txdedup/detection/similarity_scorer.h"

#include "fake_transaction_source.h"
#include "transaction_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstddef>
#include <vector>

using namespace txdedup;
using testing::candidate;
using testing::existing;

namespace {

const core::UserId kUser{"user-1"};

}  // namespace

TEST_CASE("Recurring subscription is not a duplicate", "[detector]") {
  testing::FakeTransactionSource source({existing("tx-1", "2024-02-14", "-15.99", "Netflix")});
  core::FixedClock clock("2024-03-01T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {candidate("2024-01-15", "-15.99", "Netflix")});

  CHECK(result.classifications.empty());
  CHECK(result.classification_for(0).kind == domain::ClassificationKind::kNoMatch);
  CHECK(detector.detect_duplicates(kUser, {candidate("2024-01-15", "-15.99", "Netflix")}).empty());
}

TEST_CASE("Same-day exact copy with a different transaction id is flagged", "[detector]") {
  auto record = existing("tx-existing", "2024-03-01", "-42.50", "Coffee Shop");
  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.transaction_id = "tx-new";
  core::FixedClock clock("2024-03-15T00:00:00Z");

  SECTION("scored 0.95 and listed as a probable duplicate") {
    testing::FakeTransactionSource source({record});
    const detection::DuplicateDetector detector(source, clock);

    const auto result = detector.detect(kUser, {c});
    const auto classification = result.classification_for(0);
    REQUIRE(classification.kind == domain::ClassificationKind::kMatches);
    REQUIRE(classification.matches.size() == 1);
    CHECK_THAT(classification.matches[0].similarity_score, Catch::Matchers::WithinAbs(0.95, 1e-9));
    CHECK(classification.matches[0].existing.transaction_id == "tx-existing");
    CHECK(classification.matches[0].reason_text() == "same amount, same date, same description");
  }

  SECTION("shared external id makes it a certain duplicate") {
    record.external_id = "bank-777";
    c.external_id = "bank-777";
    testing::FakeTransactionSource source({record});
    const detection::DuplicateDetector detector(source, clock);

    const auto result = detector.detect(kUser, {c});
    const auto classification = result.classification_for(0);
    CHECK(classification.kind == domain::ClassificationKind::kSkip);
    CHECK(classification.skip_reason == domain::IdentityMatchKind::kExternalId);

    const auto lists = result.to_match_lists();
    REQUIRE(lists.count(0) == 1);
    CHECK(lists.at(0).empty());
  }
}

TEST_CASE("Transaction id match is skipped regardless of other fields", "[detector]") {
  testing::FakeTransactionSource source({
      existing("tx-other", "2024-03-01", "-1.00", "Unrelated"),
      existing("TX-42", "2024-02-20", "-99.99", "Completely different"),
  });
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.transaction_id = "tx-42";

  const auto result = detector.detect(kUser, {c});
  const auto classification = result.classification_for(0);
  CHECK(classification.kind == domain::ClassificationKind::kSkip);
  CHECK(classification.skip_reason == domain::IdentityMatchKind::kTransactionId);
  CHECK(result.stats.skipped == 1);
}

TEST_CASE("Re-imported CSV rows without identifiers are skipped", "[detector]") {
  testing::FakeTransactionSource source({existing("tx-1", "2024-03-01", "-42.50", "Coffee Shop")});
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {candidate("2024-03-01", "-42.50", "coffee shop")});
  CHECK(result.classification_for(0).skip_reason == domain::IdentityMatchKind::kExactFields);
}

TEST_CASE("Empty history yields an empty result", "[detector]") {
  testing::FakeTransactionSource source;
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {candidate("2024-03-01", "-42.50", "Coffee Shop"),
                                              candidate("2024-03-02", "-5.00", "Bakery")});
  CHECK(source.fetch_count == 1);
  CHECK(result.classifications.empty());
  CHECK(result.stats.candidates == 2);
  CHECK(result.stats.pairs_scored == 0);
}

TEST_CASE("Empty batch does not touch the source", "[detector]") {
  testing::FakeTransactionSource source({existing("tx-1", "2024-03-01", "-42.50", "Coffee Shop")});
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {});
  CHECK(source.fetch_count == 0);
  CHECK(result.classifications.empty());
  CHECK_FALSE(result.window.has_value());
}

TEST_CASE("Matches are ranked by score descending", "[detector]") {
  auto near = existing("tx-near", "2024-03-01", "-42.80", "Coffee Shop");
  near.merchant_name = "Blue Bottle";
  auto exact = existing("tx-exact", "2024-03-01", "-42.50", "Coffee Shop");
  exact.merchant_name = "Blue Bottle";

  // Fetch order puts the weaker match first
  testing::FakeTransactionSource source({near, exact});
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.merchant_name = "Blue Bottle";
  c.transaction_id = "tx-new";

  const auto lists = detector.detect_duplicates(kUser, {c});
  REQUIRE(lists.count(0) == 1);
  const auto& matches = lists.at(0);
  REQUIRE(matches.size() == 2);
  CHECK(matches[0].existing.transaction_id == "tx-exact");
  CHECK_THAT(matches[0].similarity_score, Catch::Matchers::WithinAbs(0.95, 1e-9));
  CHECK(matches[1].existing.transaction_id == "tx-near");
  CHECK_THAT(matches[1].similarity_score, Catch::Matchers::WithinAbs(0.91, 1e-9));
}

TEST_CASE("Equal scores keep the fetch order", "[detector]") {
  auto near = existing("tx-near", "2024-03-01", "-42.80", "Coffee Shop");
  near.merchant_name = "Blue Bottle";

  // Exact copies whose ids differ from the candidate's all score 0.95
  testing::FakeTransactionSource source({
      near,
      existing("tx-z", "2024-03-01", "-42.50", "Coffee Shop"),
      existing("tx-a", "2024-03-01", "-42.50", "Coffee Shop"),
      existing("tx-m", "2024-03-01", "-42.50", "Coffee Shop"),
  });
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.merchant_name = "Blue Bottle";
  c.transaction_id = "tx-new";

  const auto lists = detector.detect_duplicates(kUser, {c});
  REQUIRE(lists.count(0) == 1);
  const auto& matches = lists.at(0);
  REQUIRE(matches.size() == 4);
  CHECK(matches[0].existing.transaction_id == "tx-z");
  CHECK(matches[1].existing.transaction_id == "tx-a");
  CHECK(matches[2].existing.transaction_id == "tx-m");
  CHECK(matches[3].existing.transaction_id == "tx-near");
  for (std::size_t i = 0; i < 3; ++i) {
    CHECK_THAT(matches[i].similarity_score, Catch::Matchers::WithinAbs(0.95, 1e-9));
  }
}

TEST_CASE("Query window spans the batch with a 35-day margin", "[detector][window]") {
  testing::FakeTransactionSource source;
  core::FixedClock clock("2024-06-01T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {candidate("2024-01-20", "-1.00", "a"),
                                              candidate("2024-01-10", "-1.00", "b")});

  REQUIRE(source.last_start.has_value());
  REQUIRE(source.last_end.has_value());
  CHECK(core::format_iso_date(*source.last_start) == "2023-12-06");
  CHECK(core::format_iso_date(*source.last_end) == "2024-02-24");
  CHECK(source.last_user == kUser);
  REQUIRE(result.window.has_value());
  CHECK(result.window->start == *source.last_start);
}

TEST_CASE("Threshold decides membership in the match list", "[detector]") {
  const std::vector<domain::ExistingTransactionRecord> history = {
      existing("e1", "2024-03-01", "-42.80", "Coffee Shop"),
      existing("e2", "2024-03-02", "-42.50", "Coffee Shop"),
      existing("e3", "2024-03-01", "-43.00", "Coffee Shop Downtown"),
      existing("e4", "2024-03-01", "-42.52", "Coffee Shop"),
      existing("e5", "2024-03-20", "42.50", "Coffee Shop"),
      existing("e6", "2024-03-01", "-42.50", "Coffee Shop"),
  };
  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.transaction_id = "tx-new";
  c.merchant_name = "Blue Bottle";

  testing::FakeTransactionSource source(history);
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);
  const detection::SimilarityScorer scorer;

  const auto classification = detector.classify_batch({c}, history).classification_for(0);
  REQUIRE(classification.kind == domain::ClassificationKind::kMatches);

  for (const auto& record : history) {
    const double score = scorer.score(c, record).score;
    bool listed = false;
    for (const auto& match : classification.matches) {
      listed = listed || match.existing.transaction_id == record.transaction_id;
    }
    INFO("record " << record.transaction_id << " score " << score);
    CHECK(listed == (score >= 0.90));
  }
}

TEST_CASE("Candidates are classified independently", "[detector]") {
  testing::FakeTransactionSource source({
      existing("tx-1", "2024-03-01", "-42.50", "Coffee Shop"),
      existing("tx-2", "2024-02-14", "-15.99", "Netflix"),
  });
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  const auto result = detector.detect(kUser, {
                                                 candidate("2024-03-01", "-42.50", "Coffee Shop"),
                                                 candidate("2024-01-15", "-15.99", "Netflix"),
                                                 candidate("2024-03-05", "-120.00", "Hardware"),
                                             });

  CHECK(result.classification_for(0).kind == domain::ClassificationKind::kSkip);
  CHECK(result.classification_for(1).kind == domain::ClassificationKind::kNoMatch);
  CHECK(result.classification_for(2).kind == domain::ClassificationKind::kNoMatch);
  CHECK(result.classifications.size() == 1);
  CHECK(source.fetch_count == 1);
  CHECK(result.stats.existing_fetched == 2);
}
