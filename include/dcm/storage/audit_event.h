#pragma once

#include <string>
#include <vector>

namespace dcm::storage {

// AuditEvent is one structured operational event. payload is a JSON object
// rendered as text; refs lists the work-unit identifiers the event concerns.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace dcm::storage
