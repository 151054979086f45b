#include "prodsim/vector/index_snapshot.h"

namespace prodsim::vector {

IndexSnapshot::IndexSnapshot(SnapshotStamp stamp, std::size_t dimension,
                             std::vector<float> centroids, std::vector<double> centroid_norms,
                             std::vector<ListPtr> lists, std::shared_ptr<const Locator> locator,
                             std::size_t inserted_since_build)
    : stamp_(stamp),
      dimension_(dimension),
      centroids_(std::move(centroids)),
      centroid_norms_(std::move(centroid_norms)),
      lists_(std::move(lists)),
      locator_(locator ? std::move(locator) : std::make_shared<const Locator>()),
      inserted_since_build_(inserted_since_build) {
  for (const auto& l : lists_) {
    size_ += l->size();
  }
}

std::optional<std::size_t> IndexSnapshot::list_of(const std::string& item_id) const {
  const auto it = locator_->find(item_id);
  if (it == locator_->end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace prodsim::vector
