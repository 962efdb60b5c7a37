#include "txdedup/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace txdedup::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

Date SystemClock::today() {
  return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

Date FixedClock::today() {
  const auto date = parse_iso_date(fixed_time_);
  if (!date.has_value()) {
    throw std::invalid_argument("FixedClock timestamp has no ISO date: " + fixed_time_);
  }
  return date.value();
}

}  // namespace txdedup::core
