#pragma once

#include "prodsim/storage/audit_log.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace prodsim::storage::sqlite {

// Audit log persisted in the audit_events table. Events keep their append order
// within a trace through a per-trace idx column.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  // Caller holds db_->mutex().
  int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace prodsim::storage::sqlite
