#pragma once

#include <string>
#include <vector>

namespace prodsim::storage {

// Structured log record. payload is a JSON object serialized with nlohmann::json;
// trace_id groups the events of one refresh cycle or one API request.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace prodsim::storage
