#pragma once

#include "prodsim/storage/alert_store.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <memory>

namespace prodsim::storage::sqlite {

// quality_alerts table, keyed by item_id. replace_all() runs as one transaction
// (DELETE + INSERT), so readers on other connections see the old set or the new set.
class SqliteAlertStore final : public IAlertStore {
 public:
  explicit SqliteAlertStore(std::shared_ptr<SqliteDb> db);

  void replace_all(const std::vector<domain::QualityAlert>& alerts) override;
  [[nodiscard]] std::optional<domain::QualityAlert> get(const core::ItemId& id) const override;
  [[nodiscard]] std::vector<domain::QualityAlert> list(domain::RiskLevel min_level) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace prodsim::storage::sqlite
