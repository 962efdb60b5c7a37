#include "txdedup/domain/duplicate_match.h"

namespace txdedup::domain {

const char* identity_match_kind_to_string(IdentityMatchKind kind) {
  switch (kind) {
    case IdentityMatchKind::kTransactionId:
      return "transaction_id";
    case IdentityMatchKind::kExternalId:
      return "external_id";
    case IdentityMatchKind::kExactFields:
      return "exact_fields";
  }
  return "unknown";
}

const char* classification_kind_to_string(ClassificationKind kind) {
  switch (kind) {
    case ClassificationKind::kNoMatch:
      return "no_match";
    case ClassificationKind::kSkip:
      return "skip";
    case ClassificationKind::kMatches:
      return "matches";
  }
  return "unknown";
}

std::string MatchCandidate::reason_text() const {
  std::string text;
  for (const auto& reason : match_reasons) {
    if (!text.empty()) {
      text += ", ";
    }
    text += reason;
  }
  return text;
}

Classification DetectionResult::classification_for(std::size_t index) const {
  auto it = classifications.find(index);
  if (it != classifications.end()) {
    return it->second;
  }
  return Classification::no_match();
}

std::map<std::size_t, std::vector<MatchCandidate>> DetectionResult::to_match_lists() const {
  std::map<std::size_t, std::vector<MatchCandidate>> lists;
  for (const auto& [index, classification] : classifications) {
    lists[index] = classification.matches;
  }
  return lists;
}

}  // namespace txdedup::domain
