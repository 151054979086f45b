#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/domain/item.h"

#include <optional>
#include <vector>

namespace prodsim::storage {

// Read side of the external catalog. prodsim never mutates catalog data during a
// refresh; upsert() exists for import tooling and tests.
class ICatalogRepository {
 public:
  virtual ~ICatalogRepository() = default;

  virtual void upsert(const domain::Item& item) = 0;
  [[nodiscard]] virtual std::optional<domain::Item> get(const core::ItemId& id) const = 0;
  // Ordered by item_id.
  [[nodiscard]] virtual std::vector<domain::Item> list_all() const = 0;

 protected:
  ICatalogRepository() = default;
  ICatalogRepository(const ICatalogRepository&) = default;
  ICatalogRepository& operator=(const ICatalogRepository&) = default;
  ICatalogRepository(ICatalogRepository&&) = default;
  ICatalogRepository& operator=(ICatalogRepository&&) = default;
};

// Raw review aggregates, the input of the quality classifier.
class IReviewRepository {
 public:
  virtual ~IReviewRepository() = default;

  virtual void append(const domain::ReviewRecord& review) = 0;
  // Ordered by item_id, then insertion order.
  [[nodiscard]] virtual std::vector<domain::ReviewRecord> list_all() const = 0;

 protected:
  IReviewRepository() = default;
  IReviewRepository(const IReviewRepository&) = default;
  IReviewRepository& operator=(const IReviewRepository&) = default;
  IReviewRepository(IReviewRepository&&) = default;
  IReviewRepository& operator=(IReviewRepository&&) = default;
};

}  // namespace prodsim::storage
