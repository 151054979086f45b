#pragma once

#include "prodsim/storage/repositories.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <memory>

namespace prodsim::storage::sqlite {

// Local mirror of the catalog (catalog_items table), filled by `prodsim import-catalog`.
class SqliteCatalogRepository final : public ICatalogRepository {
 public:
  explicit SqliteCatalogRepository(std::shared_ptr<SqliteDb> db);

  void upsert(const domain::Item& item) override;
  [[nodiscard]] std::optional<domain::Item> get(const core::ItemId& id) const override;
  [[nodiscard]] std::vector<domain::Item> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

class SqliteReviewRepository final : public IReviewRepository {
 public:
  explicit SqliteReviewRepository(std::shared_ptr<SqliteDb> db);

  void append(const domain::ReviewRecord& review) override;
  [[nodiscard]] std::vector<domain::ReviewRecord> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace prodsim::storage::sqlite
