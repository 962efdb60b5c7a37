#include "txdedup/core/id_generator.h"

#include <chrono>
#include <initializer_list>
#include <string>

namespace txdedup::core {

namespace {

std::string join_id(std::string_view prefix, std::initializer_list<unsigned long long> parts) {
  std::string id{prefix};
  for (const auto part : parts) {
    id += '-';
    id += std::to_string(part);
  }
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros =
      static_cast<unsigned long long>(duration_cast<microseconds>(since_epoch).count());
  return join_id(prefix, {micros, counter_.fetch_add(1, std::memory_order_relaxed)});
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return join_id(prefix, {counter_.fetch_add(1, std::memory_order_relaxed)});
}

}  // namespace txdedup::core
