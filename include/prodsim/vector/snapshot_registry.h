#pragma once

#include "prodsim/domain/embedding.h"
#include "prodsim/vector/index_snapshot.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>

namespace prodsim::vector {

// SnapshotRegistry holds the "current" IndexSnapshot per modality.
// Readers pin a snapshot by copying the shared_ptr; publish() swaps the pointer, so a
// query that pinned the old snapshot keeps using it until it finishes and no reader
// ever sees a half-built index.
class SnapshotRegistry {
 public:
  SnapshotRegistry() = default;

  SnapshotRegistry(const SnapshotRegistry&) = delete;
  SnapshotRegistry& operator=(const SnapshotRegistry&) = delete;
  SnapshotRegistry(SnapshotRegistry&&) = delete;
  SnapshotRegistry& operator=(SnapshotRegistry&&) = delete;

  // nullptr when nothing has been published for the modality yet.
  [[nodiscard]] SnapshotPtr current(domain::Modality modality) const;

  // Publishes several snapshots as one step: a reader that pins two modalities
  // after this returns sees both new snapshots.
  void publish(const std::map<domain::Modality, SnapshotPtr>& snapshots);
  void publish(SnapshotPtr snapshot);

  // Monotonic version numbers for SnapshotStamp.
  [[nodiscard]] std::uint64_t next_version() { return next_version_.fetch_add(1) + 1; }

 private:
  mutable std::mutex mutex_;
  std::map<domain::Modality, SnapshotPtr> current_;
  std::atomic<std::uint64_t> next_version_{0};
};

}  // namespace prodsim::vector
