#pragma once

#include "prodsim/core/clock.h"
#include "prodsim/core/id_generator.h"
#include "prodsim/core/ids.h"
#include "prodsim/core/result.h"
#include "prodsim/core/services.h"
#include "prodsim/domain/json.h"
#include "prodsim/domain/quality.h"
#include "prodsim/domain/recommendation.h"
#include "prodsim/indexing/refresh_run.h"
#include "prodsim/matching/recommendation_engine.h"
#include "prodsim/storage/audit_event.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::app {

// ────────────────────────────────────────────────────────────────
// Recommendations
// ────────────────────────────────────────────────────────────────

struct RecommendationRequest {
  core::ItemId item_id;                                // NOLINT(readability-identifier-naming)
  int k{10};                                           // NOLINT(readability-identifier-naming)
  domain::Modality modality{domain::Modality::kText};  // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct RecommendationResponse {
  std::string trace_id;                                             // NOLINT(readability-identifier-naming)
  core::Result<domain::RecommendationResult, core::Error> result;  // NOLINT(readability-identifier-naming)
};

// Answer one recommendation query.
// Emits audit event: RecommendationServed or RecommendationFailed
[[nodiscard]] RecommendationResponse run_recommendation(const RecommendationRequest& req,
                                                        const matching::RecommendationEngine& engine,
                                                        core::Services& services,
                                                        core::IIdGenerator& id_gen,
                                                        core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Catalog Import
// ────────────────────────────────────────────────────────────────

struct CatalogImportResponse {
  std::string trace_id;  // NOLINT(readability-identifier-naming)
  std::size_t items{0};    // NOLINT(readability-identifier-naming)
  std::size_t reviews{0};  // NOLINT(readability-identifier-naming)
};

// Upserts every item and appends every review of the document.
// Emits audit event: CatalogImported
[[nodiscard]] CatalogImportResponse run_catalog_import(const domain::CatalogDocument& document,
                                                       core::Services& services,
                                                       core::IIdGenerator& id_gen,
                                                       core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Embedding History
// ────────────────────────────────────────────────────────────────

struct EmbeddingRollbackResponse {
  std::string trace_id;                                      // NOLINT(readability-identifier-naming)
  core::Result<domain::Embedding, core::Error> restored;  // NOLINT(readability-identifier-naming)
};

// Retired versions, newest first. The current version comes from the store's get().
[[nodiscard]] std::vector<domain::Embedding> fetch_embedding_history(const core::ItemId& item_id,
                                                                     domain::Modality modality,
                                                                     core::Services& services);

// Restores the newest retired version as the current one. Published snapshots are
// untouched; the next refresh cycle picks the restored vector up.
// Emits audit event: EmbeddingRolledBack or EmbeddingRollbackFailed
[[nodiscard]] EmbeddingRollbackResponse run_embedding_rollback(const core::ItemId& item_id,
                                                               domain::Modality modality,
                                                               core::Services& services,
                                                               core::IIdGenerator& id_gen,
                                                               core::IClock& clock);

[[nodiscard]] nlohmann::json embedding_to_json(const domain::Embedding& embedding);

// ────────────────────────────────────────────────────────────────
// Quality Feed
// ────────────────────────────────────────────────────────────────

// Current alerts at or above min_level, most severe first.
[[nodiscard]] std::vector<domain::QualityAlert> fetch_quality_feed(domain::RiskLevel min_level,
                                                                   core::Services& services);

// ────────────────────────────────────────────────────────────────
// Audit Trace and Run History
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

[[nodiscard]] nlohmann::json audit_event_to_json(const storage::AuditEvent& event);

// Recorded refresh runs, oldest first.
[[nodiscard]] std::vector<indexing::RefreshRun> list_refresh_runs(core::Services& services);

[[nodiscard]] nlohmann::json refresh_run_to_json(const indexing::RefreshRun& run);

}  // namespace prodsim::app
