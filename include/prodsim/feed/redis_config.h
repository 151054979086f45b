#pragma once

#include <optional>
#include <string>

namespace prodsim::feed {

// RedisFeedConfig holds a parsed Redis URI plus the key namespace of the quality feed.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host            (port defaults to 6379)
//   redis://host:port/N   (N = database index)
struct RedisFeedConfig {
  std::string uri;                     // NOLINT(readability-identifier-naming)
  std::string host;                    // NOLINT(readability-identifier-naming)
  int port{6379};                      // NOLINT(readability-identifier-naming)
  int db{0};                           // NOLINT(readability-identifier-naming)
  std::string key_prefix{"prodsim"};  // NOLINT(readability-identifier-naming)
};

// Returns nullopt for an empty string, an unknown scheme, a missing host, a port
// outside 1..65535 or a non-numeric database index. No dependency on redis++.
[[nodiscard]] std::optional<RedisFeedConfig> parse_redis_uri(const std::string& uri);

// "host:port/db", for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisFeedConfig& config);

// <prefix>:alerts:current, a hash of item_id -> alert JSON.
[[nodiscard]] std::string alerts_current_key(const RedisFeedConfig& config);
// <prefix>:alerts:stream, one entry per non-OK alert per cycle.
[[nodiscard]] std::string alerts_stream_key(const RedisFeedConfig& config);

}  // namespace prodsim::feed
