#pragma once

#include "dcm/core/id_generator.h"

#include <string>

namespace dcm::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// They keep a work-unit identifier from being passed where a trace ID is expected.

struct WorkUnitId {
  std::string value;
  auto operator<=>(const WorkUnitId&) const = default;
};

// TraceId groups every audit event emitted by one monitoring session.
struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& id_gen) {
  return TraceId{id_gen.next("trace")};
}

}  // namespace dcm::core
