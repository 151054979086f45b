#include "prodsim/storage/audit_log.h"

namespace prodsim::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

std::vector<AuditEvent> InMemoryAuditLog::events_of_type(const std::string& event_type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.event_type == event_type) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

}  // namespace prodsim::storage
