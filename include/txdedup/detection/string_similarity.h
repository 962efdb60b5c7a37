#pragma once

#include <cstddef>
#include <string_view>

namespace txdedup::detection {

// levenshtein_distance counts single-byte insertions, deletions and substitutions (unit cost).
// O(|a|·|b|) time, O(min(|a|, |b|)) space.
[[nodiscard]] std::size_t levenshtein_distance(std::string_view a, std::string_view b);

// string_similarity normalizes edit distance to [0, 1]:
//   identical (including both empty) -> 1.0
//   exactly one empty                -> 0.0
//   otherwise                        -> 1 - distance / max(|a|, |b|)
// Callers normalize (trim, case-fold) beforehand; comparison here is byte-exact.
[[nodiscard]] double string_similarity(std::string_view a, std::string_view b);

}  // namespace txdedup::detection
