#include "txdedup/detection/similarity_scorer.h"

#include "txdedup/core/normalization.h"
#include "txdedup/detection/amount_comparator.h"
#include "txdedup/detection/date_comparator.h"
#include "txdedup/detection/identity_filter.h"
#include "txdedup/detection/string_similarity.h"

#include <algorithm>

namespace txdedup::detection {

const char* score_path_to_string(ScorePath path) {
  switch (path) {
    case ScorePath::kExactFields:
      return "exact_fields";
    case ScorePath::kRecurring:
      return "recurring";
    case ScorePath::kWeighted:
      return "weighted";
  }
  return "unknown";
}

SimilarityScorer::SimilarityScorer(ScoringConfig config) : config_(std::move(config)) {}

double SimilarityScorer::description_weight(double similarity) const {
  for (const auto& tier : config_.description_weight_tiers) {
    if (similarity >= tier.min_similarity) {
      return tier.weight;
    }
  }
  return config_.description_weight_floor;
}

PairScore SimilarityScorer::score(const domain::CandidateTransaction& candidate,
                                  const domain::ExistingTransactionRecord& existing) const {
  PairScore result;
  result.reasons = build_match_reasons(candidate, existing, config_);

  const FieldAgreement agreement = compare_fields(candidate, existing, config_);
  const auto existing_date = existing.parsed_date();

  if (agreement.all()) {
    result.path = ScorePath::kExactFields;
    result.score = config_.exact_fields_score;
    return result;
  }

  if (agreement.description && agreement.amount && !agreement.date) {
    result.recurrence = assess_recurrence(candidate.date, existing_date, config_.recurring_band);
    if (result.recurrence.recurring) {
      result.path = ScorePath::kRecurring;
      result.score = config_.recurring_score;
      return result;
    }
  }

  result.path = ScorePath::kWeighted;
  auto& parts = result.breakdown;

  parts.amount = amount_similarity(candidate.amount, existing.amount, config_);
  parts.date = date_similarity(candidate.date, existing_date, config_);
  parts.description = string_similarity(core::normalize_description(candidate.description),
                                        core::normalize_description(existing.description));
  parts.description_weight = description_weight(parts.description);

  double total = parts.amount * config_.weights.amount + parts.date * config_.weights.date +
                 parts.description * parts.description_weight;

  if (core::has_text(candidate.merchant_name) && core::has_text(existing.merchant_name)) {
    parts.merchant_included = true;
    parts.merchant = string_similarity(core::normalize_merchant(candidate.merchant_name),
                                       core::normalize_merchant(existing.merchant_name));
    total += parts.merchant * config_.weights.merchant;
  }

  result.score = std::min(1.0, total);
  return result;
}

std::vector<std::string> build_match_reasons(const domain::CandidateTransaction& candidate,
                                             const domain::ExistingTransactionRecord& existing,
                                             const ScoringConfig& config) {
  const FieldAgreement agreement = compare_fields(candidate, existing, config);

  std::vector<std::string> reasons;
  if (agreement.amount) {
    reasons.emplace_back("same amount");
  }
  if (agreement.date) {
    reasons.emplace_back("same date");
  }
  if (agreement.description) {
    reasons.emplace_back("same description");
  } else {
    const double similarity =
        string_similarity(core::normalize_description(candidate.description),
                          core::normalize_description(existing.description));
    if (similarity > config.similar_description_reason_cutoff) {
      reasons.emplace_back("similar description");
    }
  }
  return reasons;
}

}  // namespace txdedup::detection
