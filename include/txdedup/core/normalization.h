#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace txdedup::core {

// Deterministic ASCII-only normalization utilities.
// Locale-independent, byte-stable output across platforms and compilers.
// Bytes outside A-Z are preserved unchanged (UTF-8 descriptions pass through as-is).

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// equals_ignore_case compares two strings with ASCII case folding.
inline bool equals_ignore_case(const std::string_view a, const std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') {
      ca = static_cast<char>(ca + ('a' - 'A'));
    }
    if (cb >= 'A' && cb <= 'Z') {
      cb = static_cast<char>(cb + ('a' - 'A'));
    }
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

// normalize_description case-folds and trims a statement description.
// Two descriptions are "the same" when their normalized forms are byte-equal.
inline std::string normalize_description(const std::string_view description) {
  return normalize_ascii_lower(trim(description));
}

// normalize_merchant treats an absent merchant name like an empty one.
inline std::string normalize_merchant(const std::optional<std::string>& merchant) {
  return merchant.has_value() ? normalize_description(*merchant) : std::string{};
}

// has_text is true when an optional field is present and non-empty.
inline bool has_text(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

}  // namespace txdedup::core
