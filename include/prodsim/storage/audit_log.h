#pragma once

#include "prodsim/storage/audit_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace prodsim::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  virtual void append(const AuditEvent& event) = 0;

  // Events of one trace in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

  // Events of a given type across all traces, in append order.
  [[nodiscard]] std::vector<AuditEvent> events_of_type(const std::string& event_type) const;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

}  // namespace prodsim::storage
