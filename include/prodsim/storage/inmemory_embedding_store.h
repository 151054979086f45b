#pragma once

#include "prodsim/storage/embedding_store.h"

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace prodsim::storage {

class InMemoryEmbeddingStore final : public IEmbeddingStore {
 public:
  // Throws std::invalid_argument when validate_store_config() rejects config.
  InMemoryEmbeddingStore(EmbeddingStoreConfig config, core::IClock& clock);

  [[nodiscard]] core::Result<domain::Embedding, core::Error> upsert(
      const core::ItemId& item_id, domain::Modality modality, const vector::Vector& vector,
      const std::string& source_version) override;
  [[nodiscard]] core::Result<bool, core::Error> upsert_batch(
      const std::vector<EmbeddingWrite>& writes) override;
  [[nodiscard]] core::Result<domain::Embedding, core::Error> get(
      const core::ItemId& item_id, domain::Modality modality) const override;
  [[nodiscard]] bool is_stale(const core::ItemId& item_id, domain::Modality modality,
                              core::Timestamp catalog_last_modified) const override;
  [[nodiscard]] EmbeddingSnapshot snapshot(domain::Modality modality) const override;
  [[nodiscard]] std::vector<domain::Embedding> history(const core::ItemId& item_id,
                                                       domain::Modality modality) const override;
  [[nodiscard]] core::Result<domain::Embedding, core::Error> rollback(
      const core::ItemId& item_id, domain::Modality modality) override;
  [[nodiscard]] std::uint64_t generation() const override;
  [[nodiscard]] std::size_t configured_dim(domain::Modality modality) const override {
    return config_.dim_for(modality);
  }

 private:
  struct Slot {
    std::optional<domain::Embedding> current;
    std::deque<domain::Embedding> retired;  // newest first
  };
  using Key = std::pair<std::string, domain::Modality>;

  // Caller holds mutex_.
  domain::Embedding write_locked(const core::ItemId& item_id, domain::Modality modality,
                                 const vector::Vector& vector, const std::string& source_version);

  EmbeddingStoreConfig config_;
  core::IClock& clock_;
  mutable std::mutex mutex_;
  std::map<Key, Slot> slots_;
  std::uint64_t generation_{0};
};

}  // namespace prodsim::storage
