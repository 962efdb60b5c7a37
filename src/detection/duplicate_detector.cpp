#include "txdedup/detection/duplicate_detector.h"

#include "txdedup/detection/identity_filter.h"
#include "txdedup/detection/query_window.h"

#include <algorithm>
#include <exception>

namespace txdedup::detection {

DuplicateDetector::DuplicateDetector(const storage::ITransactionSource& source, core::IClock& clock,
                                     ScoringConfig config, const IPairScorer* scorer)
    : source_(source),
      clock_(clock),
      config_(std::move(config)),
      default_scorer_(config_),
      scorer_(scorer != nullptr ? scorer : &default_scorer_) {}

domain::DetectionResult DuplicateDetector::detect(
    const core::UserId& user_id, const std::vector<domain::CandidateTransaction>& candidates) const {
  if (candidates.empty()) {
    return domain::DetectionResult{};
  }

  const auto window = compute_query_window(candidates, clock_.today(), config_);
  const auto existing =
      source_.fetch_by_user_and_date_range(user_id, window.start, window.end);

  auto result = classify_batch(candidates, existing);
  result.window = window;
  return result;
}

std::map<std::size_t, std::vector<domain::MatchCandidate>> DuplicateDetector::detect_duplicates(
    const core::UserId& user_id, const std::vector<domain::CandidateTransaction>& candidates) const {
  return detect(user_id, candidates).to_match_lists();
}

domain::DetectionResult DuplicateDetector::classify_batch(
    const std::vector<domain::CandidateTransaction>& candidates,
    const std::vector<domain::ExistingTransactionRecord>& existing) const {
  domain::DetectionResult result;
  result.stats.candidates = candidates.size();
  result.stats.existing_fetched = existing.size();

  // Nothing on record: no duplicate is possible
  if (existing.empty()) {
    return result;
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    auto classification = classify_candidate(i, candidates[i], existing, result);
    switch (classification.kind) {
      case domain::ClassificationKind::kSkip:
        ++result.stats.skipped;
        result.classifications.emplace(i, std::move(classification));
        break;
      case domain::ClassificationKind::kMatches:
        ++result.stats.flagged;
        result.classifications.emplace(i, std::move(classification));
        break;
      case domain::ClassificationKind::kNoMatch:
        break;
    }
  }

  return result;
}

domain::Classification DuplicateDetector::classify_candidate(
    std::size_t index, const domain::CandidateTransaction& candidate,
    const std::vector<domain::ExistingTransactionRecord>& existing,
    domain::DetectionResult& result) const {
  for (const auto& record : existing) {
    if (const auto identity = find_identity_match(candidate, record, config_)) {
      return domain::Classification::skip(*identity);
    }
  }

  std::vector<domain::MatchCandidate> matches;
  for (const auto& record : existing) {
    PairScore pair;
    try {
      pair = scorer_->score(candidate, record);
    } catch (const std::exception& e) {
      ++result.stats.pairs_failed;
      result.failures.push_back({index, record.transaction_id, e.what()});
      continue;
    }
    ++result.stats.pairs_scored;

    const double score = std::clamp(pair.score, 0.0, 1.0);
    if (score >= config_.duplicate_threshold) {
      matches.push_back({record, score, std::move(pair.reasons)});
    }
  }

  if (matches.empty()) {
    return domain::Classification::no_match();
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const domain::MatchCandidate& a, const domain::MatchCandidate& b) {
                     return a.similarity_score > b.similarity_score;
                   });
  return domain::Classification::with_matches(std::move(matches));
}

}  // namespace txdedup::detection
