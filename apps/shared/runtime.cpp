#include "runtime.h"

#include "prodsim/adapters/embedding_provider.h"
#include "prodsim/adapters/text_generator.h"
#include "prodsim/feed/redis_alert_publisher.h"
#include "prodsim/feed/redis_config.h"
#include "prodsim/storage/alert_store.h"
#include "prodsim/storage/audit_log.h"
#include "prodsim/storage/inmemory_embedding_store.h"
#include "prodsim/storage/inmemory_repositories.h"
#include "prodsim/storage/sqlite/sqlite_alert_store.h"
#include "prodsim/storage/sqlite/sqlite_audit_log.h"
#include "prodsim/storage/sqlite/sqlite_embedding_store.h"
#include "prodsim/storage/sqlite/sqlite_refresh_run_store.h"
#include "prodsim/storage/sqlite/sqlite_repositories.h"

#include <exception>
#include <utility>

namespace prodsim::apps {

namespace {

core::Result<std::shared_ptr<storage::sqlite::SqliteDb>, std::string> open_database(
    const std::string& path) {
  using R = core::Result<std::shared_ptr<storage::sqlite::SqliteDb>, std::string>;
  auto db_result = storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    return R::err("Failed to open database: " + db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    return R::err("Failed to initialize schema: " + schema_result.error());
  }
  return R::ok(db);
}

}  // namespace

Runtime::~Runtime() = default;

core::Result<std::unique_ptr<Runtime>, std::string> Runtime::open(const RuntimeConfig& config) {
  using R = core::Result<std::unique_ptr<Runtime>, std::string>;

  std::unique_ptr<Runtime> rt(new Runtime());
  rt->persistent_ = config.db_path.has_value();

  auto db_result = open_database(config.db_path.value_or(":memory:"));
  if (!db_result.has_value()) {
    return R::err(db_result.error());
  }
  rt->db_ = db_result.value();

  try {
    if (rt->persistent_) {
      rt->catalog_ = std::make_unique<storage::sqlite::SqliteCatalogRepository>(rt->db_);
      rt->reviews_ = std::make_unique<storage::sqlite::SqliteReviewRepository>(rt->db_);
      rt->embeddings_ = std::make_unique<storage::sqlite::SqliteEmbeddingStore>(
          rt->db_, config.store, rt->clock_);
      rt->alerts_ = std::make_unique<storage::sqlite::SqliteAlertStore>(rt->db_);
      rt->audit_log_ = std::make_unique<storage::sqlite::SqliteAuditLog>(rt->db_);
    } else {
      rt->catalog_ = std::make_unique<storage::InMemoryCatalogRepository>();
      rt->reviews_ = std::make_unique<storage::InMemoryReviewRepository>();
      rt->embeddings_ = std::make_unique<storage::InMemoryEmbeddingStore>(config.store, rt->clock_);
      rt->alerts_ = std::make_unique<storage::InMemoryAlertStore>();
      rt->audit_log_ = std::make_unique<storage::InMemoryAuditLog>();
    }
    rt->runs_ = std::make_unique<storage::sqlite::SqliteRefreshRunStore>(rt->db_);
  } catch (const std::exception& e) {
    return R::err(std::string("Failed to open stores: ") + e.what());
  }

  auto index = vector::VectorIndex::create(config.ivf);
  if (!index.has_value()) {
    return R::err("Invalid index options: " + index.error().message);
  }
  rt->vector_index_ = std::make_unique<vector::VectorIndex>(std::move(index.value()));
  rt->snapshots_ = std::make_unique<vector::SnapshotRegistry>();

  rt->embedding_provider_ = std::make_unique<adapters::DeterministicStubEmbeddingProvider>(
      config.store.text_dim, config.store.image_dim);
  rt->text_generator_ = std::make_unique<adapters::TemplateTextGenerator>();

  if (config.redis_uri.has_value()) {
    auto feed_config = feed::parse_redis_uri(*config.redis_uri);
    if (!feed_config.has_value()) {
      return R::err("Invalid Redis URI: " + *config.redis_uri);
    }
    feed_config->key_prefix = config.redis_prefix;
    try {
      rt->alert_publisher_ = std::make_unique<feed::RedisAlertPublisher>(*feed_config);
    } catch (const std::exception& e) {
      return R::err(e.what());
    }
  }

  rt->services_ = std::make_unique<core::Services>(
      *rt->catalog_, *rt->reviews_, *rt->embeddings_, *rt->alerts_, *rt->audit_log_, *rt->runs_,
      *rt->vector_index_, *rt->snapshots_, *rt->embedding_provider_, rt->text_generator_.get(),
      rt->alert_publisher_.get());

  try {
    rt->pipeline_ = std::make_unique<indexing::RefreshPipeline>(
        *rt->services_, rt->id_gen_, rt->clock_, config.refresh, config.quality);
  } catch (const std::exception& e) {
    return R::err(e.what());
  }

  rt->engine_ = std::make_unique<matching::RecommendationEngine>(
      *rt->embeddings_, *rt->snapshots_, *rt->vector_index_, rt->clock_, config.recommendation,
      matching::RecommendationEnrichment{rt->text_generator_.get(), rt->catalog_.get()});

  // Snapshots are derived state; rebuild them from whatever the store already holds.
  auto warmed = rt->pipeline_->warm_indexes();
  if (!warmed.has_value()) {
    return R::err("Failed to build indexes: " + std::string(core::to_string(warmed.error().code)) + ": " +
                  warmed.error().message);
  }

  return R::ok(std::move(rt));
}

}  // namespace prodsim::apps
