#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace txdedup::core {

// Issues trace and audit event ids.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Returns "<prefix>-..."; never empty.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<epoch micros>-<counter>". Unique per process.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-0", "<prefix>-1", ... for reproducible audit traces.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace txdedup::core
