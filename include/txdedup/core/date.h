#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace txdedup::core {

// Calendar date without time zone. Transactions are posted on a day, not an instant.
using Date = std::chrono::year_month_day;

// parse_iso_date accepts "YYYY-MM-DD" and the date prefix of an ISO 8601 timestamp
// ("YYYY-MM-DDThh:mm:ss..."). Surrounding whitespace is ignored.
// Returns nullopt for anything else, including impossible calendar days (2024-02-30).
[[nodiscard]] std::optional<Date> parse_iso_date(std::string_view text);

// format_iso_date renders "YYYY-MM-DD" (zero padded).
[[nodiscard]] std::string format_iso_date(const Date& date);

// Absolute number of days between two dates.
[[nodiscard]] long days_between(const Date& a, const Date& b);

[[nodiscard]] Date add_days(const Date& date, long days);

// subtract_months clamps to the last day of the target month (2024-03-31 - 1 month = 2024-02-29).
[[nodiscard]] Date subtract_months(const Date& date, int months);

}  // namespace txdedup::core
