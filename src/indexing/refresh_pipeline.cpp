#include "prodsim/indexing/refresh_pipeline.h"

#include "prodsim/indexing/worker_pool.h"
#include "prodsim/quality/evidence.h"

#include <algorithm>
#include <exception>
#include <future>
#include <set>
#include <stdexcept>
#include <utility>

namespace prodsim::indexing {

struct RefreshPipeline::Candidate {
  const domain::Item* item{nullptr};
  domain::Modality modality{domain::Modality::kText};
  bool retry{false};  // failed in the last completed run
};

struct RefreshPipeline::Outcome {
  std::optional<vector::Vector> vector;
  std::optional<core::Error> error;
  std::size_t attempts{0};
};

std::string validate_refresh_config(const RefreshConfig& config) {
  if (config.modalities.empty()) {
    return "at least one modality must be configured";
  }
  if (config.max_concurrency == 0) {
    return "max_concurrency must be at least 1";
  }
  if (!(config.rebuild_fraction > 0.0 && config.rebuild_fraction <= 1.0)) {
    return "rebuild_fraction must be in (0, 1]";
  }
  return adapters::validate_retry_policy(config.retry);
}

std::string index_action_to_string(IndexAction action) {
  switch (action) {
    case IndexAction::kNone:
      return "none";
    case IndexAction::kIncremental:
      return "incremental";
    case IndexAction::kFull:
      return "full";
  }
  return "unknown";
}

nlohmann::json refresh_result_to_json(const RefreshResult& result) {
  nlohmann::json j;
  j["run_id"] = result.run_id;
  j["status"] = refresh_run_status_to_string(result.status);
  j["items_considered"] = result.items_considered;
  j["candidates"] = result.candidates;
  j["embedded"] = result.embedded;
  j["failed"] = result.failures.size();

  nlohmann::json failures = nlohmann::json::array();
  for (const auto& f : result.failures) {
    failures.push_back({{"item_id", f.item_id},
                        {"modality", f.modality},
                        {"attempts", f.attempts},
                        {"error_code", f.error_code},
                        {"error_message", f.error_message}});
  }
  j["failures"] = failures;

  nlohmann::json indexes = nlohmann::json::array();
  for (const auto& m : result.indexes) {
    indexes.push_back({{"modality", domain::modality_to_string(m.modality)},
                       {"action", index_action_to_string(m.action)},
                       {"inserted", m.inserted},
                       {"snapshot_version", m.snapshot_version},
                       {"size", m.size}});
  }
  j["indexes"] = indexes;

  nlohmann::json by_level = nlohmann::json::object();
  for (const auto level : {domain::RiskLevel::kHighRisk, domain::RiskLevel::kMediumRisk,
                           domain::RiskLevel::kMonitor, domain::RiskLevel::kOk}) {
    const auto it = result.alerts_by_level.find(level);
    by_level[domain::risk_level_to_string(level)] =
        it == result.alerts_by_level.end() ? 0 : it->second;
  }
  j["alerts_by_level"] = by_level;
  j["reviews_analyzed"] = result.reviews_analyzed;
  j["avg_sentiment"] =
      result.avg_sentiment.has_value() ? nlohmann::json(*result.avg_sentiment) : nlohmann::json();

  if (result.error.has_value()) {
    j["error"] = {{"code", core::to_string(result.error->code)},
                  {"message", result.error->message}};
  }
  if (!result.warnings.empty()) {
    j["warnings"] = result.warnings;
  }
  return j;
}

RefreshPipeline::RefreshPipeline(core::Services& services, core::IIdGenerator& id_gen,
                                 core::IClock& clock, RefreshConfig config,
                                 quality::QualityConfig quality_config)
    : services_(services),
      id_gen_(id_gen),
      clock_(clock),
      config_(std::move(config)),
      aggregator_(std::move(quality_config), clock, services.text_generator) {
  const std::string reason = validate_refresh_config(config_);
  if (!reason.empty()) {
    throw std::invalid_argument("invalid refresh config: " + reason);
  }
  source_version_ = config_.source_version.empty()
                        ? services_.embedding_provider.provider_id() + "/v1"
                        : config_.source_version;
}

void RefreshPipeline::emit(const std::string& run_id, const std::string& event_type,
                           const nlohmann::json& payload, std::vector<std::string> refs) {
  services_.audit_log.append(
      {id_gen_.next("evt"), run_id, event_type, payload.dump(), clock_.now_iso8601(), std::move(refs)});
}

RefreshResult RefreshPipeline::finish(RefreshResult result, RefreshRun run,
                                      const std::string& event_type) {
  const nlohmann::json summary = refresh_result_to_json(result);
  run.status = result.status;
  run.completed_at = clock_.now_iso8601();
  run.summary_json = summary.dump();
  services_.runs.upsert_run(run);
  emit(result.run_id, event_type, summary);
  return result;
}

std::vector<RefreshPipeline::Candidate> RefreshPipeline::select_candidates(
    const std::vector<domain::Item>& items) const {
  std::set<std::pair<std::string, domain::Modality>> retry_set;
  for (const auto& failure : services_.runs.failures_of_last_completed_run()) {
    const auto modality = domain::modality_from_string(failure.modality);
    if (modality.has_value()) {
      retry_set.emplace(failure.item_id, *modality);
    }
  }

  std::vector<Candidate> retries;
  std::vector<Candidate> stale;
  for (const auto modality : config_.modalities) {
    for (const auto& item : items) {
      if (retry_set.count({item.item_id.value, modality}) > 0) {
        retries.push_back({&item, modality, true});
      } else if (services_.embeddings.is_stale(item.item_id, modality, item.last_modified)) {
        stale.push_back({&item, modality, false});
      }
    }
  }

  retries.insert(retries.end(), stale.begin(), stale.end());
  return retries;
}

std::vector<RefreshPipeline::Outcome> RefreshPipeline::embed_all(
    const std::vector<Candidate>& candidates, const core::CancellationToken& cancel) {
  std::vector<Outcome> outcomes(candidates.size());
  if (candidates.empty()) {
    return outcomes;
  }

  WorkerPool pool(std::min(config_.max_concurrency, candidates.size()));
  std::vector<std::future<Outcome>> futures;
  futures.reserve(candidates.size());

  for (const auto& candidate : candidates) {
    futures.push_back(pool.submit([this, &candidate, &cancel]() {
      const auto content = domain::make_embedding_content(*candidate.item, candidate.modality);
      const std::size_t expected = services_.embeddings.configured_dim(candidate.modality);

      Outcome outcome;
      // Each attempt may be abandoned at its deadline and finish after this task, so
      // the call owns copies of everything but the provider.
      auto result = adapters::call_with_retry<vector::Vector>(
          config_.retry, &cancel,
          [provider = &services_.embedding_provider, content, modality = candidate.modality,
           item_id = candidate.item->item_id,
           expected](std::chrono::milliseconds timeout) -> core::Result<vector::Vector, core::Error> {
            auto embedded = provider->embed(content, modality, timeout);
            // A wrong-length vector is a provider defect, not a transient failure.
            if (embedded.has_value() && embedded.value().size() != expected) {
              return core::Result<vector::Vector, core::Error>::err(
                  storage::dimension_mismatch(item_id, modality, expected, embedded.value().size()));
            }
            return embedded;
          },
          &outcome.attempts);

      if (result.has_value()) {
        outcome.vector = std::move(result.value());
      } else {
        outcome.error = result.error();
      }
      return outcome;
    }));
  }

  for (std::size_t i = 0; i < futures.size(); ++i) {
    outcomes[i] = futures[i].get();
  }
  return outcomes;
}

core::Result<vector::SnapshotPtr, core::Error> RefreshPipeline::maintain_index(
    const domain::Modality modality, const std::string& run_id, IndexMaintenance& report) {
  using R = core::Result<vector::SnapshotPtr, core::Error>;

  const auto stored = services_.embeddings.snapshot(modality);
  const auto current = services_.snapshots.current(modality);
  const std::size_t dim = services_.embeddings.configured_dim(modality);
  const std::string modality_name = domain::modality_to_string(modality);
  report.modality = modality;

  const auto make_stamp = [&]() {
    return vector::SnapshotStamp{modality, services_.snapshots.next_version(), stored.generation,
                                 clock_.now()};
  };

  std::string reason;
  std::vector<vector::Insertion> delta;
  if (current == nullptr) {
    reason = "no_snapshot";
  } else if (current->dimension() != dim) {
    reason = "dimension_changed";
  } else {
    for (const auto& e : stored.embeddings) {
      if (e.version > current->stamp().store_generation) {
        delta.push_back({e.item_id.value, e.vector});
      }
    }
    if (delta.empty()) {
      report.action = IndexAction::kNone;
      report.snapshot_version = current->stamp().version;
      report.size = current->size();
      return R::ok(nullptr);
    }
    const double drift = static_cast<double>(current->inserted_since_build() + delta.size());
    if (drift > config_.rebuild_fraction * static_cast<double>(stored.embeddings.size())) {
      reason = "drift";
    }
  }

  if (!reason.empty()) {
    auto built = services_.vector_index.build(dim, stored.embeddings, make_stamp());
    if (!built.has_value()) {
      return built;
    }
    const auto& snapshot = built.value();
    report.action = IndexAction::kFull;
    report.inserted = stored.embeddings.size();
    report.snapshot_version = snapshot->stamp().version;
    report.size = snapshot->size();

    nlohmann::json payload;
    payload["modality"] = modality_name;
    payload["reason"] = reason;
    payload["snapshot_version"] = report.snapshot_version;
    payload["store_generation"] = stored.generation;
    payload["size"] = report.size;
    payload["num_lists"] = snapshot->num_lists();
    emit(run_id, "IndexRebuilt", payload);
    return built;
  }

  auto extended = services_.vector_index.insert_batch(*current, delta, make_stamp());
  if (!extended.has_value()) {
    return extended;
  }
  const auto& snapshot = extended.value();
  report.action = IndexAction::kIncremental;
  report.inserted = delta.size();
  report.snapshot_version = snapshot->stamp().version;
  report.size = snapshot->size();

  nlohmann::json payload;
  payload["modality"] = modality_name;
  payload["inserted"] = delta.size();
  payload["inserted_since_build"] = snapshot->inserted_since_build();
  payload["snapshot_version"] = report.snapshot_version;
  payload["store_generation"] = stored.generation;
  payload["size"] = report.size;
  emit(run_id, "IndexInsertApplied", payload);
  return extended;
}

void RefreshPipeline::regenerate_alerts(const std::vector<domain::Item>& items,
                                        const std::string& run_id, RefreshResult& result) {
  const auto reviews = services_.reviews.list_all();

  std::set<std::string> known;
  for (const auto& item : items) {
    known.insert(item.item_id.value);
  }

  double sentiment_sum = 0.0;
  std::size_t sentiment_count = 0;
  for (const auto& review : reviews) {
    if (known.count(review.item_id.value) == 0) {
      continue;
    }
    ++result.reviews_analyzed;
    const auto score = quality::parse_sentiment_score(review.sentiment_raw);
    if (score.has_value()) {
      sentiment_sum += *score;
      ++sentiment_count;
    }
  }
  if (sentiment_count > 0) {
    result.avg_sentiment = sentiment_sum / static_cast<double>(sentiment_count);
  }

  const auto alerts = aggregator_.generate_alerts(items, reviews);
  for (const auto& alert : alerts) {
    ++result.alerts_by_level[alert.risk_level];
  }
  services_.alerts.replace_all(alerts);

  bool published = false;
  if (services_.alert_publisher != nullptr) {
    const auto sent = services_.alert_publisher->publish(alerts, run_id);
    if (sent.has_value()) {
      published = true;
    } else {
      result.warnings.push_back("alert feed publish failed: " + sent.error().message);
    }
  }

  nlohmann::json by_level = nlohmann::json::object();
  for (const auto& [level, count] : result.alerts_by_level) {
    by_level[domain::risk_level_to_string(level)] = count;
  }
  nlohmann::json payload;
  payload["alerts"] = alerts.size();
  payload["by_level"] = by_level;
  payload["reviews_analyzed"] = result.reviews_analyzed;
  payload["published"] = published;
  emit(run_id, "AlertsRegenerated", payload);
}

RefreshResult RefreshPipeline::run_cycle(const core::CancellationToken& cancel) {
  std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

  RefreshResult result;
  result.run_id = id_gen_.next("run");
  RefreshRun run{result.run_id, clock_.now_iso8601(), std::nullopt, RefreshRunStatus::kRunning,
                 "{}"};
  services_.runs.upsert_run(run);

  nlohmann::json modalities = nlohmann::json::array();
  for (const auto m : config_.modalities) {
    modalities.push_back(domain::modality_to_string(m));
  }
  nlohmann::json started;
  started["run_id"] = result.run_id;
  started["provider_id"] = services_.embedding_provider.provider_id();
  started["source_version"] = source_version_;
  started["modalities"] = modalities;
  emit(result.run_id, "RefreshStarted", started);

  const auto cancelled = [&](const std::string& phase) {
    result.status = RefreshRunStatus::kCancelled;
    result.warnings.push_back("cancelled " + phase);
    return finish(std::move(result), run, "RefreshCancelled");
  };
  const auto failed = [&](core::Error error) {
    result.status = RefreshRunStatus::kFailed;
    result.error = std::move(error);
    return finish(std::move(result), run, "RefreshFailed");
  };

  const auto items = services_.catalog.list_all();
  result.items_considered = items.size();
  const auto candidates = select_candidates(items);
  result.candidates = candidates.size();

  if (cancel.cancelled()) {
    return cancelled("before embedding");
  }

  // Phase 1: embed off to the side.
  const auto outcomes = embed_all(candidates, cancel);
  if (cancel.cancelled()) {
    return cancelled("during embedding; staged results discarded");
  }

  std::vector<storage::EmbeddingWrite> staged;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto& candidate = candidates[i];
    const auto& outcome = outcomes[i];
    if (outcome.vector.has_value()) {
      staged.push_back({candidate.item->item_id, candidate.modality, *outcome.vector,
                        source_version_});
      continue;
    }
    RefreshFailure failure{result.run_id,
                           candidate.item->item_id.value,
                           domain::modality_to_string(candidate.modality),
                           outcome.attempts,
                           std::string(core::to_string(outcome.error->code)),
                           outcome.error->message};
    services_.runs.record_failure(failure);

    nlohmann::json payload;
    payload["item_id"] = failure.item_id;
    payload["modality"] = failure.modality;
    payload["attempts"] = failure.attempts;
    payload["error_code"] = failure.error_code;
    payload["error_message"] = failure.error_message;
    payload["retried_from_previous_run"] = candidate.retry;
    emit(result.run_id, "EmbeddingFailed", payload, {failure.item_id});
    result.failures.push_back(std::move(failure));
  }

  // Phase 2: commit. Everything after this point only derives state from the store.
  if (!staged.empty()) {
    std::optional<core::Error> commit_error;
    try {
      const auto committed = services_.embeddings.upsert_batch(staged);
      if (!committed.has_value()) {
        commit_error = committed.error();
      }
    } catch (const std::exception& e) {
      commit_error = core::make_error(core::ErrorCode::kExternalServiceError,
                                      std::string("embedding store: ") + e.what());
    }
    if (commit_error.has_value()) {
      return failed(*commit_error);
    }
  }
  result.embedded = staged.size();

  nlohmann::json committed_payload;
  committed_payload["embedded"] = result.embedded;
  committed_payload["failed"] = result.failures.size();
  committed_payload["store_generation"] = services_.embeddings.generation();
  emit(result.run_id, "EmbeddingsCommitted", committed_payload);

  if (cancel.cancelled()) {
    return cancelled("after commit; snapshots not updated");
  }

  // Phase 3: index maintenance, published together at the end.
  std::map<domain::Modality, vector::SnapshotPtr> pending;
  try {
    for (const auto modality : config_.modalities) {
      IndexMaintenance report;
      auto snapshot = maintain_index(modality, result.run_id, report);
      if (!snapshot.has_value()) {
        return failed(snapshot.error());
      }
      if (snapshot.value() != nullptr) {
        pending[modality] = snapshot.value();
      }
      result.indexes.push_back(report);
    }

    if (cancel.cancelled()) {
      result.indexes.clear();
      return cancelled("after commit; new snapshots discarded");
    }

    // Phase 4: quality alerts.
    regenerate_alerts(items, result.run_id, result);
  } catch (const std::exception& e) {
    return failed(core::make_error(core::ErrorCode::kExternalServiceError, e.what()));
  }

  if (!pending.empty()) {
    services_.snapshots.publish(pending);
  }

  result.status = RefreshRunStatus::kCompleted;
  return finish(std::move(result), run, "RefreshCompleted");
}

core::Result<std::vector<IndexMaintenance>, core::Error> RefreshPipeline::warm_indexes() {
  using R = core::Result<std::vector<IndexMaintenance>, core::Error>;
  std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

  std::map<domain::Modality, vector::SnapshotPtr> built;
  std::vector<IndexMaintenance> reports;
  for (const auto modality : config_.modalities) {
    const auto stored = services_.embeddings.snapshot(modality);
    const vector::SnapshotStamp stamp{modality, services_.snapshots.next_version(),
                                      stored.generation, clock_.now()};
    auto snapshot = services_.vector_index.build(services_.embeddings.configured_dim(modality),
                                                 stored.embeddings, stamp);
    if (!snapshot.has_value()) {
      return R::err(snapshot.error());
    }
    reports.push_back({modality, IndexAction::kFull, stored.embeddings.size(),
                       snapshot.value()->stamp().version, snapshot.value()->size()});
    built[modality] = snapshot.value();
  }
  services_.snapshots.publish(built);
  return R::ok(std::move(reports));
}

}  // namespace prodsim::indexing
