#pragma once

#include "prodsim/core/clock.h"
#include "prodsim/core/ids.h"
#include "prodsim/core/result.h"
#include "prodsim/domain/embedding.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prodsim::storage {

// Per-modality dimensions are fixed for the lifetime of a store.
// retained_versions bounds how many retired versions each (item, modality) keeps for rollback.
struct EmbeddingStoreConfig {
  std::size_t text_dim{0};
  std::size_t image_dim{0};
  std::size_t retained_versions{2};

  [[nodiscard]] std::size_t dim_for(const domain::Modality m) const {
    return m == domain::Modality::kText ? text_dim : image_dim;
  }
};

// Returns empty string when valid, otherwise a human-readable reason.
[[nodiscard]] std::string validate_store_config(const EmbeddingStoreConfig& config);

struct EmbeddingWrite {
  core::ItemId item_id;
  domain::Modality modality{domain::Modality::kText};
  vector::Vector vector;
  std::string source_version;
};

// Consistent read of every current embedding of one modality.
// generation is the store generation the read reflects; embeddings are ordered by item_id.
struct EmbeddingSnapshot {
  std::uint64_t generation{0};
  std::vector<domain::Embedding> embeddings;
};

// IEmbeddingStore holds versioned per-item vectors.
// Invariants:
//   - at most one current embedding per (item_id, modality)
//   - every stored vector has exactly configured_dim(modality) components
//   - writes supersede, never mutate: the previous current version is retired
//     and kept (up to retained_versions) for rollback
class IEmbeddingStore {
 public:
  virtual ~IEmbeddingStore() = default;

  // DimensionMismatch when vector.size() != configured_dim(modality); the prior
  // current embedding is left untouched in that case.
  [[nodiscard]] virtual core::Result<domain::Embedding, core::Error> upsert(
      const core::ItemId& item_id, domain::Modality modality, const vector::Vector& vector,
      const std::string& source_version) = 0;

  // All-or-nothing: every write is validated before any is applied.
  [[nodiscard]] virtual core::Result<bool, core::Error> upsert_batch(
      const std::vector<EmbeddingWrite>& writes) = 0;

  [[nodiscard]] virtual core::Result<domain::Embedding, core::Error> get(
      const core::ItemId& item_id, domain::Modality modality) const = 0;

  // True when the current embedding was created before catalog_last_modified,
  // or when there is no current embedding at all.
  [[nodiscard]] virtual bool is_stale(const core::ItemId& item_id, domain::Modality modality,
                                      core::Timestamp catalog_last_modified) const = 0;

  [[nodiscard]] virtual EmbeddingSnapshot snapshot(domain::Modality modality) const = 0;

  // Retired versions, newest first.
  [[nodiscard]] virtual std::vector<domain::Embedding> history(
      const core::ItemId& item_id, domain::Modality modality) const = 0;

  // Re-publishes the newest retired version as a new current version.
  // NotFound when there is no current embedding or nothing retired.
  [[nodiscard]] virtual core::Result<domain::Embedding, core::Error> rollback(
      const core::ItemId& item_id, domain::Modality modality) = 0;

  [[nodiscard]] virtual std::uint64_t generation() const = 0;

  [[nodiscard]] virtual std::size_t configured_dim(domain::Modality modality) const = 0;

 protected:
  IEmbeddingStore() = default;
  IEmbeddingStore(const IEmbeddingStore&) = default;
  IEmbeddingStore& operator=(const IEmbeddingStore&) = default;
  IEmbeddingStore(IEmbeddingStore&&) = default;
  IEmbeddingStore& operator=(IEmbeddingStore&&) = default;
};

// Shared by both implementations.
[[nodiscard]] core::Error dimension_mismatch(const core::ItemId& item_id,
                                             domain::Modality modality, std::size_t expected,
                                             std::size_t actual);

}  // namespace prodsim::storage
