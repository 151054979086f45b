#include "prodsim/storage/inmemory_repositories.h"

namespace prodsim::storage {

void InMemoryCatalogRepository::upsert(const domain::Item& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  items_[item.item_id.value] = item;
}

std::optional<domain::Item> InMemoryCatalogRepository::get(const core::ItemId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = items_.find(id.value);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Item> InMemoryCatalogRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Item> out;
  out.reserve(items_.size());
  for (const auto& [_, item] : items_) {
    out.push_back(item);
  }
  return out;
}

void InMemoryReviewRepository::append(const domain::ReviewRecord& review) {
  std::lock_guard<std::mutex> lock(mutex_);
  reviews_[review.item_id.value].push_back(review);
}

std::vector<domain::ReviewRecord> InMemoryReviewRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::ReviewRecord> out;
  for (const auto& [_, rows] : reviews_) {
    out.insert(out.end(), rows.begin(), rows.end());
  }
  return out;
}

}  // namespace prodsim::storage
