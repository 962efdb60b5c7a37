#include "txdedup/core/clock.h"
#include "txdedup/detection/duplicate_detector.h"
#include "txdedup/detection/similarity_scorer.h"

#include "fake_transaction_source.h"
#include "transaction_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace txdedup;
using testing::candidate;
using testing::existing;

namespace {

// Throws for one poisoned record, delegates to the production scorer otherwise.
class PoisonedScorer final : public detection::IPairScorer {
 public:
  explicit PoisonedScorer(std::string poisoned_id) : poisoned_id_(std::move(poisoned_id)) {}

  [[nodiscard]] detection::PairScore score(
      const domain::CandidateTransaction& candidate,
      const domain::ExistingTransactionRecord& existing) const override {
    if (existing.transaction_id == poisoned_id_) {
      throw std::runtime_error("corrupt record " + poisoned_id_);
    }
    return inner_.score(candidate, existing);
  }

 private:
  std::string poisoned_id_;
  detection::SimilarityScorer inner_;
};

// Returns scores outside [0, 1].
class OutOfRangeScorer final : public detection::IPairScorer {
 public:
  [[nodiscard]] detection::PairScore score(
      const domain::CandidateTransaction& /*candidate*/,
      const domain::ExistingTransactionRecord& /*existing*/) const override {
    detection::PairScore result;
    result.score = 1.7;
    return result;
  }
};

}  // namespace

TEST_CASE("A failing pair is recorded and the rest of the batch continues", "[detector][failures]") {
  testing::FakeTransactionSource source({
      existing("tx-bad", "2024-03-01", "-42.50", "Coffee Shop"),
      existing("tx-good", "2024-03-01", "-42.50", "Coffee Shop"),
  });
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const PoisonedScorer scorer("tx-bad");
  const detection::DuplicateDetector detector(source, clock, detection::default_scoring_config(),
                                              &scorer);

  auto c = candidate("2024-03-01", "-42.50", "Coffee Shop");
  c.transaction_id = "tx-new";

  const auto result = detector.detect(core::UserId{"user-1"}, {c});

  REQUIRE(result.failures.size() == 1);
  CHECK(result.failures[0].candidate_index == 0);
  CHECK(result.failures[0].existing_transaction_id == "tx-bad");
  CHECK(result.failures[0].message == "corrupt record tx-bad");
  CHECK(result.stats.pairs_failed == 1);
  CHECK(result.stats.pairs_scored == 1);

  const auto classification = result.classification_for(0);
  REQUIRE(classification.kind == domain::ClassificationKind::kMatches);
  REQUIRE(classification.matches.size() == 1);
  CHECK(classification.matches[0].existing.transaction_id == "tx-good");
}

TEST_CASE("Scores from a custom scorer are clamped to [0, 1]", "[detector][failures]") {
  testing::FakeTransactionSource source({existing("tx-1", "2024-01-01", "-1.00", "x")});
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const OutOfRangeScorer scorer;
  const detection::DuplicateDetector detector(source, clock, detection::default_scoring_config(),
                                              &scorer);

  const auto result = detector.detect(core::UserId{"user-1"},
                                      {candidate("2024-03-01", "-42.50", "Coffee Shop")});
  const auto classification = result.classification_for(0);
  REQUIRE(classification.matches.size() == 1);
  CHECK(classification.matches[0].similarity_score == 1.0);
}

TEST_CASE("Source failures propagate out of detect", "[detector][failures]") {
  testing::FakeTransactionSource source;
  source.fail_with = "database unavailable";
  core::FixedClock clock("2024-03-15T00:00:00Z");
  const detection::DuplicateDetector detector(source, clock);

  CHECK_THROWS_AS(
      detector.detect(core::UserId{"user-1"}, {candidate("2024-03-01", "-42.50", "Coffee")}),
      std::runtime_error);
}
