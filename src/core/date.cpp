#include "txdedup/core/date.h"

#include "txdedup/core/normalization.h"

#include <cstdio>

namespace txdedup::core {

namespace {

bool parse_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::optional<Date> parse_iso_date(std::string_view text) {
  const std::string trimmed = trim(text);
  const std::string_view s{trimmed};

  // YYYY-MM-DD, optionally followed by a time part introduced by 'T' or ' '
  constexpr std::size_t kDateLength = 10;
  if (s.size() < kDateLength) {
    return std::nullopt;
  }
  if (s.size() > kDateLength && s[kDateLength] != 'T' && s[kDateLength] != ' ') {
    return std::nullopt;
  }
  if (s[4] != '-' || s[7] != '-') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (!parse_digits(s, 0, 4, year) || !parse_digits(s, 5, 2, month) ||
      !parse_digits(s, 8, 2, day)) {
    return std::nullopt;
  }

  const Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                  std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string format_iso_date(const Date& date) {
  char buffer[16];  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
  return std::string{buffer};
}

long days_between(const Date& a, const Date& b) {
  const auto diff = (std::chrono::sys_days{a} - std::chrono::sys_days{b}).count();
  return static_cast<long>(diff < 0 ? -diff : diff);
}

Date add_days(const Date& date, long days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

Date subtract_months(const Date& date, int months) {
  Date shifted = date - std::chrono::months{months};
  if (!shifted.ok()) {
    // Day overflowed the shorter month: clamp to its last day
    shifted = shifted.year() / shifted.month() / std::chrono::last;
  }
  return shifted;
}

}  // namespace txdedup::core
