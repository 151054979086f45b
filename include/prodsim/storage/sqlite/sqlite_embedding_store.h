#pragma once

#include "prodsim/storage/embedding_store.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <memory>

namespace prodsim::storage::sqlite {

// Embedding store persisted in the embeddings table. One row per version; is_current
// marks the live row. Dimensions and the generation counter live in store_meta.
//
// The constructor is the startup dimension guard: it throws std::invalid_argument when
// the config is invalid or disagrees with dimensions already recorded in the database.
// SQLite I/O failures throw std::runtime_error.
class SqliteEmbeddingStore final : public IEmbeddingStore {
 public:
  SqliteEmbeddingStore(std::shared_ptr<SqliteDb> db, EmbeddingStoreConfig config,
                       core::IClock& clock);

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
  // All private helpers expect db_->mutex() to be held.
  void check_recorded_dimensions();
  [[nodiscard]] std::uint64_t read_generation() const;
  void write_generation(std::uint64_t generation);
  domain::Embedding write_row(const core::ItemId& item_id, domain::Modality modality,
                              const vector::Vector& vector, const std::string& source_version);
  [[nodiscard]] std::vector<domain::Embedding> select_rows(const core::ItemId& item_id,
                                                           domain::Modality modality,
                                                           bool current) const;

  std::shared_ptr<SqliteDb> db_;
  EmbeddingStoreConfig config_;
  core::IClock& clock_;
};

}  // namespace prodsim::storage::sqlite
