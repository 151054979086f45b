#pragma once

#include "prodsim/core/result.h"
#include "prodsim/domain/embedding.h"
#include "prodsim/vector/index_snapshot.h"
#include "prodsim/vector/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prodsim::vector {

// IVF parameters.
//   num_lists: coarse clusters built by build(); capped at the number of vectors.
//   nprobe: lists scanned per query. Higher raises recall and cost.
//   max_training_points_per_list: k-means trains on a deterministic sample of at
//     most num_lists * this many vectors; every vector is still assigned afterwards.
struct IvfOptions {
  std::size_t num_lists{100};
  std::size_t nprobe{8};
  std::size_t max_iterations{20};
  std::size_t max_training_points_per_list{256};
  std::uint32_t seed{42};
};

struct Insertion {
  std::string item_id;
  Vector vector;
};

// VectorIndex is the stateless IVF engine: it produces and reads IndexSnapshots but
// owns none. Distance is cosine distance throughout. Every method is const and safe
// to call concurrently.
//
// Recall contract: query() is approximate. On clustered data with nprobe covering a
// modest share of the lists, top-k overlap with exact_query() stays at or above 95%
// (exercised in test_vector_index_recall.cpp). It is not exact.
class VectorIndex {
 public:
  // InvalidConfig when num_lists, nprobe or max_iterations is zero.
  [[nodiscard]] static core::Result<VectorIndex, core::Error> create(IvfOptions options);

  [[nodiscard]] const IvfOptions& options() const { return options_; }

  // Seeded spherical k-means over the inputs. An empty input yields an empty, queryable
  // snapshot. DimensionMismatch if any embedding's vector has the wrong length.
  [[nodiscard]] core::Result<SnapshotPtr, core::Error> build(
      std::size_t dimension, const std::vector<domain::Embedding>& embeddings,
      const SnapshotStamp& stamp) const;

  // Probes the nprobe lists nearest to `query`. Sorted by (distance, item_id).
  // DimensionMismatch on a wrong-length query; an empty snapshot returns no hits.
  [[nodiscard]] core::Result<std::vector<Neighbor>, core::Error> query(
      const IndexSnapshot& snapshot, const Vector& query, std::size_t top_k) const;

  // Brute force over every list: the ground truth query() is measured against.
  [[nodiscard]] core::Result<std::vector<Neighbor>, core::Error> exact_query(
      const IndexSnapshot& snapshot, const Vector& query, std::size_t top_k) const;

  // Copy-on-write insert: `snapshot` is untouched; the result shares every list the
  // insertion does not modify. An id already present is moved, not duplicated.
  // Centroids are not retrained, so quality drifts as inserts accumulate; callers
  // rebuild once inserted_since_build() grows past their threshold.
  [[nodiscard]] core::Result<SnapshotPtr, core::Error> insert(const IndexSnapshot& snapshot,
                                                              const std::string& item_id,
                                                              const Vector& vector,
                                                              const SnapshotStamp& stamp) const;

  [[nodiscard]] core::Result<SnapshotPtr, core::Error> insert_batch(
      const IndexSnapshot& snapshot, const std::vector<Insertion>& insertions,
      const SnapshotStamp& stamp) const;

 private:
  explicit VectorIndex(IvfOptions options) : options_(options) {}

  [[nodiscard]] std::vector<Neighbor> scan(const IndexSnapshot& snapshot, const Vector& query,
                                           const std::vector<std::size_t>& lists,
                                           std::size_t top_k) const;

  IvfOptions options_;
};

}  // namespace prodsim::vector
