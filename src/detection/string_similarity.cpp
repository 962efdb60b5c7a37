#include "txdedup/detection/string_similarity.h"

#include <algorithm>
#include <vector>

namespace txdedup::detection {

std::size_t levenshtein_distance(std::string_view a, std::string_view b) {
  // Keep the shorter string along the row to bound memory
  if (a.size() < b.size()) {
    std::swap(a, b);
  }
  if (b.empty()) {
    return a.size();
  }

  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }

  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1]) {
        current[j] = previous[j - 1];
      } else {
        current[j] = 1 + std::min({previous[j], current[j - 1], previous[j - 1]});
      }
    }
    std::swap(previous, current);
  }

  return previous[b.size()];
}

double string_similarity(std::string_view a, std::string_view b) {
  if (a == b) {
    return 1.0;
  }
  if (a.empty() || b.empty()) {
    return 0.0;
  }

  const auto distance = levenshtein_distance(a, b);
  const auto max_length = std::max(a.size(), b.size());
  return 1.0 - static_cast<double>(distance) / static_cast<double>(max_length);
}

}  // namespace txdedup::detection
