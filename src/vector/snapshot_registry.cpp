#include "prodsim/vector/snapshot_registry.h"

namespace prodsim::vector {

SnapshotPtr SnapshotRegistry::current(const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = current_.find(modality);
  if (it == current_.end()) {
    return nullptr;
  }
  return it->second;
}

void SnapshotRegistry::publish(const std::map<domain::Modality, SnapshotPtr>& snapshots) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [modality, snapshot] : snapshots) {
    if (snapshot) {
      current_[modality] = snapshot;
    }
  }
}

void SnapshotRegistry::publish(SnapshotPtr snapshot) {
  if (!snapshot) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  current_[snapshot->stamp().modality] = std::move(snapshot);
}

}  // namespace prodsim::vector
