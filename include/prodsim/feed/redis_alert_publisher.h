#pragma once

#include "prodsim/feed/alert_publisher.h"
#include "prodsim/feed/redis_config.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace prodsim::feed {

// RedisAlertPublisher streams the quality feed to Redis.
//
// Redis data model:
// - <prefix>:alerts:current (hash): item_id -> alert JSON, replaced wholesale per cycle
// - <prefix>:alerts:stream (stream): one entry per non-OK alert per cycle
//   - Fields: run_id, item_id, risk_level, rule_id, alert (JSON)
//
// Atomicity: each publish() is one MULTI/EXEC, so a reader of the hash never sees a
// mix of two cycles.
class RedisAlertPublisher final : public IAlertPublisher {
 public:
  // Throws std::runtime_error if the connection fails.
  explicit RedisAlertPublisher(RedisFeedConfig config);

  ~RedisAlertPublisher() override;

  RedisAlertPublisher(const RedisAlertPublisher&) = delete;
  RedisAlertPublisher& operator=(const RedisAlertPublisher&) = delete;
  RedisAlertPublisher(RedisAlertPublisher&&) = delete;
  RedisAlertPublisher& operator=(RedisAlertPublisher&&) = delete;

  // ExternalServiceError on any Redis failure.
  [[nodiscard]] core::Result<bool, core::Error> publish(
      const std::vector<domain::QualityAlert>& alerts, const std::string& run_id) override;

  [[nodiscard]] const RedisFeedConfig& config() const { return config_; }

 private:
  RedisFeedConfig config_;
  std::unique_ptr<sw::redis::Redis> redis_;
};

struct RedisHealthResult {
  bool ok{false};
  std::string error;
};

// PING against the configured server. Never throws.
[[nodiscard]] RedisHealthResult redis_ping(const RedisFeedConfig& config);

}  // namespace prodsim::feed
