#pragma once

#include "prodsim/indexing/refresh_pipeline.h"
#include "prodsim/matching/recommendation_engine.h"
#include "prodsim/quality/quality_aggregator.h"
#include "prodsim/storage/embedding_store.h"
#include "prodsim/vector/vector_index.h"

#include "arg_parser.h"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::apps {

// Flags shared by prodsim and prodsim_server. Every field has an explicit default;
// optional fields mean "not configured".
struct RuntimeConfig {
  // Without a path every store is ephemeral and lost on exit.
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  std::string redis_prefix{"prodsim"};   // NOLINT(readability-identifier-naming)
  storage::EmbeddingStoreConfig store{64, 64, 2};  // NOLINT(readability-identifier-naming)
  vector::IvfOptions ivf;                          // NOLINT(readability-identifier-naming)
  matching::RecommendationConfig recommendation;   // NOLINT(readability-identifier-naming)
  indexing::RefreshConfig refresh;                 // NOLINT(readability-identifier-naming)
  quality::QualityConfig quality;                  // NOLINT(readability-identifier-naming)
};

// Returns "" on success, otherwise the first problem found:
// zero dimensions, zero num_lists / nprobe / kmeans iterations, an invalid refresh
// config (rebuild_fraction outside (0, 1], zero max_concurrency, bad retry policy),
// or a Redis URI parse_redis_uri() rejects.
[[nodiscard]] std::string validate_runtime_config(const RuntimeConfig& config);

// "text", "image" or "text,image".
[[nodiscard]] std::optional<std::vector<domain::Modality>> parse_modalities(
    const std::string& value);

// Appends the shared flags to `options`. Config must expose a `runtime` member.
template <typename Config>
void add_runtime_options(std::vector<Option<Config>>& options) {
  const auto ms = [](std::chrono::milliseconds& target, const std::string& flag,
                     const std::string& v) {
    std::size_t millis = 0;
    if (!assign_number(millis, flag, v, parse_size_value)) {
      return false;
    }
    target = std::chrono::milliseconds(millis);
    return true;
  };

  const std::vector<Option<Config>> shared = {
      {"--db", true, "Path to SQLite database file (default: ephemeral in-memory stores)",
       [](Config& c, const std::string& v) {
         c.runtime.db_path = v;
         return true;
       }},
      {"--redis", true, "Redis URI for the quality alert feed (tcp://host:port)",
       [](Config& c, const std::string& v) {
         c.runtime.redis_uri = v;
         return true;
       }},
      {"--redis-prefix", true, "Key prefix for the Redis feed (default: prodsim)",
       [](Config& c, const std::string& v) {
         c.runtime.redis_prefix = v;
         return true;
       }},
      {"--text-dim", true, "Text embedding dimension (default: 64)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.store.text_dim, "--text-dim", v, parse_size_value);
       }},
      {"--image-dim", true, "Image embedding dimension (default: 64)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.store.image_dim, "--image-dim", v, parse_size_value);
       }},
      {"--retained-versions", true, "Retired embedding versions kept for rollback (default: 2)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.store.retained_versions, "--retained-versions", v,
                              parse_size_value);
       }},
      {"--num-lists", true, "IVF inverted lists (default: 100)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.ivf.num_lists, "--num-lists", v, parse_size_value);
       }},
      {"--nprobe", true, "IVF lists probed per query (default: 8)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.ivf.nprobe, "--nprobe", v, parse_size_value);
       }},
      {"--kmeans-iterations", true, "k-means iterations per build (default: 20)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.ivf.max_iterations, "--kmeans-iterations", v,
                              parse_size_value);
       }},
      {"--modalities", true, "Indexed modalities: text, image or text,image (default: text)",
       [](Config& c, const std::string& v) {
         const auto parsed = parse_modalities(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --modalities: " << v << " (valid: text, image, text,image)\n";
           return false;
         }
         c.runtime.refresh.modalities = *parsed;
         return true;
       }},
      {"--max-concurrency", true, "Embedding worker threads per refresh (default: 4)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.refresh.max_concurrency, "--max-concurrency", v,
                              parse_size_value);
       }},
      {"--max-attempts", true, "Embedding attempts per item per cycle (default: 3)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.refresh.retry.max_attempts, "--max-attempts", v,
                              parse_size_value);
       }},
      {"--initial-backoff-ms", true, "First retry delay (default: 200)",
       [ms](Config& c, const std::string& v) {
         return ms(c.runtime.refresh.retry.initial_backoff, "--initial-backoff-ms", v);
       }},
      {"--max-backoff-ms", true, "Retry delay cap (default: 5000)",
       [ms](Config& c, const std::string& v) {
         return ms(c.runtime.refresh.retry.max_backoff, "--max-backoff-ms", v);
       }},
      {"--call-timeout-ms", true, "Deadline per embedding call (default: 10000)",
       [ms](Config& c, const std::string& v) {
         return ms(c.runtime.refresh.retry.call_timeout, "--call-timeout-ms", v);
       }},
      {"--rebuild-fraction", true, "Insert drift that forces a full rebuild (default: 0.2)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.refresh.rebuild_fraction, "--rebuild-fraction", v,
                              parse_double_value);
       }},
      {"--max-distance", true, "Drop recommendations farther than this cosine distance",
       [](Config& c, const std::string& v) {
         double d = 0.0;
         if (!assign_number(d, "--max-distance", v, parse_double_value)) {
           return false;
         }
         c.runtime.recommendation.max_distance = d;
         return true;
       }},
      {"--explain", false, "Attach generated explanations to recommendations",
       [](Config& c, const std::string& /*v*/) {
         c.runtime.recommendation.attach_explanations = true;
         return true;
       }},
      {"--explain-timeout-ms", true, "Deadline per explanation (default: 2000)",
       [ms](Config& c, const std::string& v) {
         if (!ms(c.runtime.recommendation.explain_timeout, "--explain-timeout-ms", v)) {
           return false;
         }
         c.runtime.quality.explain_timeout = c.runtime.recommendation.explain_timeout;
         return true;
       }},
      {"--staleness-threshold-ms", true, "Warn when answering from an older snapshot",
       [ms](Config& c, const std::string& v) {
         std::chrono::milliseconds threshold{0};
         if (!ms(threshold, "--staleness-threshold-ms", v)) {
           return false;
         }
         c.runtime.recommendation.staleness_threshold = threshold;
         return true;
       }},
      {"--high-risk-rating", true, "HIGH_RISK below this average rating (default: 3.0)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.quality.thresholds.high_risk_rating_below,
                              "--high-risk-rating", v, parse_double_value);
       }},
      {"--medium-risk-negatives", true, "MEDIUM_RISK above this many negatives (default: 5)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.quality.thresholds.medium_risk_negatives_above,
                              "--medium-risk-negatives", v, parse_size_value);
       }},
      {"--medium-risk-rating", true, "MEDIUM_RISK below this average rating (default: 3.5)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.quality.thresholds.medium_risk_rating_below,
                              "--medium-risk-rating", v, parse_double_value);
       }},
      {"--monitor-rating", true, "MONITOR below this average rating (default: 4.0)",
       [](Config& c, const std::string& v) {
         return assign_number(c.runtime.quality.thresholds.monitor_rating_below,
                              "--monitor-rating", v, parse_double_value);
       }},
  };
  options.insert(options.end(), shared.begin(), shared.end());
}

}  // namespace prodsim::apps
