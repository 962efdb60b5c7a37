#pragma once

#include "txdedup/core/date.h"

#include <string>

namespace txdedup::core {

// Source of "now" for the detector. The fallback query window and audit
// timestamps both read it.
class IClock {
 public:
  virtual ~IClock() = default;

  // UTC timestamp, "YYYY-MM-DDTHH:MM:SSZ".
  virtual std::string now_iso8601() = 0;

  // Current calendar date (UTC).
  virtual Date today() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
  Date today() override;
};

// Pinned to one timestamp; today() is its date part. Used by `detect --today`.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override;
  Date today() override;

 private:
  std::string fixed_time_;
};

}  // namespace txdedup::core
