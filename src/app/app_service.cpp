#include "prodsim/app/app_service.h"

#include "prodsim/core/hashing.h"

#include <nlohmann/json.hpp>

namespace prodsim::app {

RecommendationResponse run_recommendation(const RecommendationRequest& req,
                                          const matching::RecommendationEngine& engine,
                                          core::Services& services, core::IIdGenerator& id_gen,
                                          core::IClock& clock) {
  const std::string trace_id = req.trace_id.has_value() ? *req.trace_id : id_gen.next("trace");

  auto result = engine.get_recommendations(req.item_id, req.k, req.modality);

  nlohmann::json payload;
  payload["item_id"] = req.item_id.value;
  payload["k"] = req.k;
  payload["modality"] = domain::modality_to_string(req.modality);

  if (result.has_value()) {
    const auto& served = result.value();
    nlohmann::json returned = nlohmann::json::array();
    for (const auto& rec : served.items) {
      returned.push_back(rec.item_id.value);
    }
    payload["returned"] = returned;
    payload["snapshot_version"] = served.snapshot_version;
    if (!served.warnings.empty()) {
      payload["warnings"] = served.warnings;
    }
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               "RecommendationServed",
                               payload.dump(),
                               clock.now_iso8601(),
                               {req.item_id.value}});
  } else {
    payload["error_code"] = core::to_string(result.error().code);
    payload["error_message"] = result.error().message;
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               "RecommendationFailed",
                               payload.dump(),
                               clock.now_iso8601(),
                               {req.item_id.value}});
  }

  return RecommendationResponse{trace_id, std::move(result)};
}

CatalogImportResponse run_catalog_import(const domain::CatalogDocument& document,
                                         core::Services& services, core::IIdGenerator& id_gen,
                                         core::IClock& clock) {
  const std::string trace_id = id_gen.next("trace");

  for (const auto& item : document.items) {
    services.catalog.upsert(item);
  }
  for (const auto& review : document.reviews) {
    services.reviews.append(review);
  }

  nlohmann::json payload;
  payload["items"] = document.items.size();
  payload["reviews"] = document.reviews.size();
  services.audit_log.append(
      {id_gen.next("evt"), trace_id, "CatalogImported", payload.dump(), clock.now_iso8601(), {}});

  return CatalogImportResponse{trace_id, document.items.size(), document.reviews.size()};
}

std::vector<domain::Embedding> fetch_embedding_history(const core::ItemId& item_id,
                                                      const domain::Modality modality,
                                                      core::Services& services) {
  return services.embeddings.history(item_id, modality);
}

EmbeddingRollbackResponse run_embedding_rollback(const core::ItemId& item_id,
                                                 const domain::Modality modality,
                                                 core::Services& services,
                                                 core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = id_gen.next("trace");

  nlohmann::json payload;
  payload["item_id"] = item_id.value;
  payload["modality"] = domain::modality_to_string(modality);

  const auto before = services.embeddings.get(item_id, modality);
  if (before.has_value()) {
    payload["replaced_version"] = before.value().version;
    payload["replaced_fingerprint"] = core::vector_fingerprint(before.value().vector);
  }

  auto restored = services.embeddings.rollback(item_id, modality);
  if (restored.has_value()) {
    payload["version"] = restored.value().version;
    payload["source_version"] = restored.value().source_version;
    payload["fingerprint"] = core::vector_fingerprint(restored.value().vector);
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               "EmbeddingRolledBack",
                               payload.dump(),
                               clock.now_iso8601(),
                               {item_id.value}});
  } else {
    payload["error_code"] = core::to_string(restored.error().code);
    payload["error_message"] = restored.error().message;
    services.audit_log.append({id_gen.next("evt"),
                               trace_id,
                               "EmbeddingRollbackFailed",
                               payload.dump(),
                               clock.now_iso8601(),
                               {item_id.value}});
  }

  return EmbeddingRollbackResponse{trace_id, std::move(restored)};
}

nlohmann::json embedding_to_json(const domain::Embedding& embedding) {
  nlohmann::json j;
  j["item_id"] = embedding.item_id.value;
  j["modality"] = domain::modality_to_string(embedding.modality);
  j["version"] = embedding.version;
  j["current"] = embedding.current;
  j["dim"] = embedding.dim;
  j["source_version"] = embedding.source_version;
  j["created_at"] = core::format_iso8601(embedding.created_at);
  j["fingerprint"] = core::vector_fingerprint(embedding.vector);
  return j;
}

std::vector<domain::QualityAlert> fetch_quality_feed(const domain::RiskLevel min_level,
                                                     core::Services& services) {
  return services.alerts.list(min_level);
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

nlohmann::json audit_event_to_json(const storage::AuditEvent& event) {
  nlohmann::json j;
  j["event_id"] = event.event_id;
  j["trace_id"] = event.trace_id;
  j["event_type"] = event.event_type;
  j["created_at"] = event.created_at;
  j["refs"] = event.refs;
  // Payloads are JSON objects written by this process; anything else is passed through as text.
  const auto parsed = nlohmann::json::parse(event.payload, nullptr, false);
  j["payload"] = parsed.is_discarded() ? nlohmann::json(event.payload) : parsed;
  return j;
}

std::vector<indexing::RefreshRun> list_refresh_runs(core::Services& services) {
  return services.runs.list_runs();
}

nlohmann::json refresh_run_to_json(const indexing::RefreshRun& run) {
  nlohmann::json j;
  j["run_id"] = run.run_id;
  j["status"] = indexing::refresh_run_status_to_string(run.status);
  j["started_at"] = run.started_at.has_value() ? nlohmann::json(*run.started_at) : nlohmann::json();
  j["completed_at"] =
      run.completed_at.has_value() ? nlohmann::json(*run.completed_at) : nlohmann::json();
  const auto summary = nlohmann::json::parse(run.summary_json, nullptr, false);
  j["summary"] = summary.is_discarded() ? nlohmann::json::object() : summary;
  return j;
}

}  // namespace prodsim::app
