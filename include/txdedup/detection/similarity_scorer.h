#pragma once

#include "txdedup/detection/recurring_disambiguator.h"
#include "txdedup/detection/scoring_config.h"
#include "txdedup/domain/transaction.h"

#include <string>
#include <vector>

namespace txdedup::detection {

// ScorePath records which branch of the model produced a score.
enum class ScorePath {
  kExactFields,  // description, amount and date all equal: fixed exact_fields_score
  kRecurring,    // same description+amount on a recurring interval: fixed recurring_score
  kWeighted,     // weighted blend of component scores
};

[[nodiscard]] const char* score_path_to_string(ScorePath path);

// ScoreBreakdown exposes the weighted components (zero on the fixed-score paths).
struct ScoreBreakdown {
  double amount{0.0};
  double date{0.0};
  double description{0.0};
  double description_weight{0.0};
  double merchant{0.0};
  bool merchant_included{false};
};

struct PairScore {
  double score{0.0};  // in [0, 1]
  ScorePath path{ScorePath::kWeighted};
  ScoreBreakdown breakdown;
  RecurrenceAssessment recurrence;
  std::vector<std::string> reasons;
};

// IPairScorer scores one (candidate, existing) pair. Implementations must be pure:
// the same inputs always yield the same score.
class IPairScorer {
 public:
  virtual ~IPairScorer() = default;
  [[nodiscard]] virtual PairScore score(const domain::CandidateTransaction& candidate,
                                        const domain::ExistingTransactionRecord& existing) const = 0;

 protected:
  IPairScorer() = default;
  IPairScorer(const IPairScorer&) = default;
  IPairScorer& operator=(const IPairScorer&) = default;
  IPairScorer(IPairScorer&&) = default;
  IPairScorer& operator=(IPairScorer&&) = default;
};

// SimilarityScorer is the production duplicate model.
// 1. description, amount and date all equal -> exact_fields_score (0.95)
// 2. description and amount equal, dates differ on a recurring interval -> recurring_score (0.30)
// 3. otherwise amount·0.30 + date·0.20 + description·w(sim) + merchant·0.20, capped at 1.0,
//    where w(sim) is 0.30 for near-exact text, 0.05 for moderately similar text and 0.01 below,
//    and the merchant term only applies when both sides name a merchant.
class SimilarityScorer final : public IPairScorer {
 public:
  explicit SimilarityScorer(ScoringConfig config = default_scoring_config());

  [[nodiscard]] PairScore score(const domain::CandidateTransaction& candidate,
                                const domain::ExistingTransactionRecord& existing) const override;

  [[nodiscard]] const ScoringConfig& config() const { return config_; }

 private:
  ScoringConfig config_;

  [[nodiscard]] double description_weight(double similarity) const;
};

// build_match_reasons lists the human-readable agreements of a pair:
// "same amount", "same date", and "same description" or, when the normalized descriptions
// differ but are more similar than config.similar_description_reason_cutoff, "similar description".
[[nodiscard]] std::vector<std::string> build_match_reasons(
    const domain::CandidateTransaction& candidate,
    const domain::ExistingTransactionRecord& existing, const ScoringConfig& config);

}  // namespace txdedup::detection
