#pragma once

#include "prodsim/core/time.h"
#include "prodsim/domain/embedding.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prodsim::vector {

// One inverted list. Vectors are stored row-major in `data` (ids.size() * dim floats)
// with their L2 norms precomputed, so a probe is a linear scan over contiguous memory.
struct InvertedList {
  std::vector<std::string> ids;
  std::vector<float> data;
  std::vector<double> norms;

  [[nodiscard]] std::size_t size() const { return ids.size(); }
};

// Provenance of a snapshot, supplied by whoever builds or publishes it.
struct SnapshotStamp {
  domain::Modality modality{domain::Modality::kText};
  std::uint64_t version{0};
  // Highest EmbeddingStore version incorporated; the refresh pipeline computes
  // its insert delta as every embedding with a greater version.
  std::uint64_t store_generation{0};
  core::Timestamp created_at{};
};

// Immutable IVF index. Once constructed nothing in it changes; "mutation" produces a
// new snapshot that shares every untouched inverted list with this one.
class IndexSnapshot {
 public:
  using ListPtr = std::shared_ptr<const InvertedList>;
  using Locator = std::unordered_map<std::string, std::size_t>;

  IndexSnapshot(SnapshotStamp stamp, std::size_t dimension, std::vector<float> centroids,
                std::vector<double> centroid_norms, std::vector<ListPtr> lists,
                std::shared_ptr<const Locator> locator, std::size_t inserted_since_build);

  [[nodiscard]] const SnapshotStamp& stamp() const { return stamp_; }
  [[nodiscard]] std::size_t dimension() const { return dimension_; }
  [[nodiscard]] std::size_t size() const { return size_; }
  [[nodiscard]] bool empty() const { return size_ == 0; }
  [[nodiscard]] std::size_t num_lists() const { return lists_.size(); }
  [[nodiscard]] std::size_t inserted_since_build() const { return inserted_since_build_; }

  [[nodiscard]] const float* centroid(std::size_t list) const {
    return centroids_.data() + list * dimension_;
  }
  [[nodiscard]] double centroid_norm(std::size_t list) const { return centroid_norms_[list]; }
  [[nodiscard]] const InvertedList& list(std::size_t index) const { return *lists_[index]; }
  [[nodiscard]] const std::vector<ListPtr>& lists() const { return lists_; }
  [[nodiscard]] const std::vector<float>& centroids() const { return centroids_; }
  [[nodiscard]] const std::vector<double>& centroid_norms() const { return centroid_norms_; }
  [[nodiscard]] const std::shared_ptr<const Locator>& locator() const { return locator_; }

  // Inverted list holding item_id, if indexed.
  [[nodiscard]] std::optional<std::size_t> list_of(const std::string& item_id) const;

 private:
  SnapshotStamp stamp_;
  std::size_t dimension_;
  std::vector<float> centroids_;
  std::vector<double> centroid_norms_;
  std::vector<ListPtr> lists_;
  std::shared_ptr<const Locator> locator_;
  std::size_t inserted_since_build_;
  std::size_t size_{0};
};

using SnapshotPtr = std::shared_ptr<const IndexSnapshot>;

}  // namespace prodsim::vector
