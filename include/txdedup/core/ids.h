#pragma once

#include "txdedup/core/id_generator.h"

#include <string>

namespace txdedup::core {

// Strong ID types (C.11: make concrete types regular).
// Vocabulary types that keep a user id from being passed where a trace id is expected.

struct UserId {
  std::string value;
  auto operator<=>(const UserId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }

}  // namespace txdedup::core
