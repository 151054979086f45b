#pragma once

#include "prodsim/core/clock.h"
#include "prodsim/core/id_generator.h"
#include "prodsim/core/result.h"
#include "prodsim/core/services.h"
#include "prodsim/indexing/refresh_pipeline.h"
#include "prodsim/matching/recommendation_engine.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include "runtime_config.h"
#include <memory>
#include <string>

namespace prodsim::apps {

// Runtime owns every concrete store, adapter and engine of one process and exposes
// them through core::Services. Members are declared in dependency order so they are
// destroyed consumers-first.
//
// With --db every store is SQLite-backed. Without it the catalog, reviews, embeddings,
// alerts and audit log are in-memory; refresh runs use an in-memory SQLite database
// because SqliteRefreshRunStore is the only run store.
class Runtime {
 public:
  // Opens storage, applies the schema and connects the Redis feed when configured.
  // The error string is ready to print.
  [[nodiscard]] static core::Result<std::unique_ptr<Runtime>, std::string> open(
      const RuntimeConfig& config);

  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(Runtime&&) = delete;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] indexing::RefreshPipeline& pipeline() { return *pipeline_; }
  [[nodiscard]] const matching::RecommendationEngine& engine() const { return *engine_; }
  [[nodiscard]] core::IIdGenerator& id_gen() { return id_gen_; }
  [[nodiscard]] core::IClock& clock() { return clock_; }
  [[nodiscard]] bool persistent() const { return persistent_; }
  [[nodiscard]] bool feed_connected() const { return alert_publisher_ != nullptr; }

 private:
  Runtime() = default;

  core::SystemClock clock_;
  core::SystemIdGenerator id_gen_;
  bool persistent_{false};

  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::unique_ptr<storage::ICatalogRepository> catalog_;
  std::unique_ptr<storage::IReviewRepository> reviews_;
  std::unique_ptr<storage::IEmbeddingStore> embeddings_;
  std::unique_ptr<storage::IAlertStore> alerts_;
  std::unique_ptr<storage::IAuditLog> audit_log_;
  std::unique_ptr<indexing::IRefreshRunStore> runs_;
  std::unique_ptr<vector::VectorIndex> vector_index_;
  std::unique_ptr<vector::SnapshotRegistry> snapshots_;
  std::unique_ptr<adapters::IEmbeddingProvider> embedding_provider_;
  std::unique_ptr<adapters::ITextGenerator> text_generator_;
  std::unique_ptr<feed::IAlertPublisher> alert_publisher_;

  std::unique_ptr<core::Services> services_;
  std::unique_ptr<indexing::RefreshPipeline> pipeline_;
  std::unique_ptr<matching::RecommendationEngine> engine_;
};

}  // namespace prodsim::apps
