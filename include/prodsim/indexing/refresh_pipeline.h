#pragma once

#include "prodsim/adapters/retry.h"
#include "prodsim/core/cancellation.h"
#include "prodsim/core/clock.h"
#include "prodsim/core/id_generator.h"
#include "prodsim/core/result.h"
#include "prodsim/core/services.h"
#include "prodsim/domain/embedding.h"
#include "prodsim/indexing/refresh_run.h"
#include "prodsim/quality/quality_aggregator.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::indexing {

// Configuration for refresh cycles.
// rebuild_fraction: an incremental insert that would push inserted_since_build past
// this share of the index size triggers a full rebuild instead.
// source_version is stamped on every embedding written; empty means
// "<provider_id>/v1".
struct RefreshConfig {
  std::vector<domain::Modality> modalities{domain::Modality::kText};
  std::size_t max_concurrency{4};
  adapters::RetryPolicy retry;
  double rebuild_fraction{0.2};
  std::string source_version;
};

// Returns empty string when valid, otherwise a human-readable reason.
[[nodiscard]] std::string validate_refresh_config(const RefreshConfig& config);

enum class IndexAction { kNone, kIncremental, kFull };

[[nodiscard]] std::string index_action_to_string(IndexAction action);

struct IndexMaintenance {
  domain::Modality modality{domain::Modality::kText};
  IndexAction action{IndexAction::kNone};
  std::size_t inserted{0};
  std::uint64_t snapshot_version{0};
  std::size_t size{0};
};

// Outcome of one cycle, also persisted as the run's summary_json.
// candidates: (item, modality) pairs that needed an embedding
// embedded: embeddings committed to the store
// failures: items that exhausted their retries or returned an unusable vector
// error: set when status is kFailed
struct RefreshResult {
  std::string run_id;
  RefreshRunStatus status{RefreshRunStatus::kRunning};
  std::size_t items_considered{0};
  std::size_t candidates{0};
  std::size_t embedded{0};
  std::vector<RefreshFailure> failures;
  std::vector<IndexMaintenance> indexes;
  std::map<domain::RiskLevel, std::size_t> alerts_by_level;
  std::size_t reviews_analyzed{0};
  std::optional<double> avg_sentiment;
  std::optional<core::Error> error;
  std::vector<std::string> warnings;
};

[[nodiscard]] nlohmann::json refresh_result_to_json(const RefreshResult& result);

// RefreshPipeline keeps embeddings, index snapshots and quality alerts in step with the
// catalog. One cycle:
//   1. Candidates: items whose embedding is missing or older than the catalog entry,
//      with the failures of the last completed run first.
//   2. Embeddings are computed on a bounded WorkerPool; each item retries on its own.
//   3. Results are staged and committed with one upsert_batch. A cancellation before
//      this point discards the staging and touches nothing.
//   4. Each modality's snapshot is extended in place or rebuilt off to the side.
//   5. Alerts are regenerated from all reviews and replace the previous set.
//   6. New snapshots are published together.
// Emits RefreshStarted, EmbeddingFailed, EmbeddingsCommitted, IndexRebuilt,
// IndexInsertApplied, AlertsRegenerated and RefreshCompleted / RefreshCancelled,
// all with the run_id as trace_id.
//
// Cycles on one pipeline are serialized.
class RefreshPipeline {
 public:
  RefreshPipeline(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                  RefreshConfig config = {}, quality::QualityConfig quality_config = {});

  [[nodiscard]] RefreshResult run_cycle(const core::CancellationToken& cancel);

  // Builds and publishes every configured modality from the store without calling the
  // provider. Snapshots are not persisted, so processes call this once at startup.
  [[nodiscard]] core::Result<std::vector<IndexMaintenance>, core::Error> warm_indexes();

  [[nodiscard]] const RefreshConfig& config() const { return config_; }

 private:
  struct Candidate;
  struct Outcome;

  [[nodiscard]] std::vector<Candidate> select_candidates(
      const std::vector<domain::Item>& items) const;
  [[nodiscard]] std::vector<Outcome> embed_all(const std::vector<Candidate>& candidates,
                                               const core::CancellationToken& cancel);
  // New snapshot for `modality`, or nullptr when the published one is already current.
  [[nodiscard]] core::Result<vector::SnapshotPtr, core::Error> maintain_index(
      domain::Modality modality, const std::string& run_id, IndexMaintenance& report);
  void regenerate_alerts(const std::vector<domain::Item>& items, const std::string& run_id,
                         RefreshResult& result);

  RefreshResult finish(RefreshResult result, RefreshRun run, const std::string& event_type);
  void emit(const std::string& run_id, const std::string& event_type,
            const nlohmann::json& payload, std::vector<std::string> refs = {});

  core::Services& services_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  RefreshConfig config_;
  quality::QualityAggregator aggregator_;
  std::string source_version_;
  std::mutex cycle_mutex_;
};

}  // namespace prodsim::indexing
