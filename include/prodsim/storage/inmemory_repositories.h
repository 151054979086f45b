#pragma once

#include "prodsim/storage/repositories.h"

#include <map>
#include <mutex>
#include <string>

namespace prodsim::storage {

class InMemoryCatalogRepository final : public ICatalogRepository {
 public:
  void upsert(const domain::Item& item) override;
  [[nodiscard]] std::optional<domain::Item> get(const core::ItemId& id) const override;
  [[nodiscard]] std::vector<domain::Item> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, domain::Item> items_;
};

class InMemoryReviewRepository final : public IReviewRepository {
 public:
  void append(const domain::ReviewRecord& review) override;
  [[nodiscard]] std::vector<domain::ReviewRecord> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<domain::ReviewRecord>> reviews_;
};

}  // namespace prodsim::storage
