#include "prodsim/feed/redis_alert_publisher.h"

#include "prodsim/domain/json.h"

#include <sw/redis++/redis++.h>

#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prodsim::feed {

namespace {

sw::redis::ConnectionOptions connection_options(const RedisFeedConfig& config) {
  sw::redis::ConnectionOptions opts;
  opts.host = config.host;
  opts.port = config.port;
  opts.db = config.db;
  opts.connect_timeout = std::chrono::milliseconds(2000);
  opts.socket_timeout = std::chrono::milliseconds(2000);
  return opts;
}

}  // namespace

RedisAlertPublisher::RedisAlertPublisher(RedisFeedConfig config) : config_(std::move(config)) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(connection_options(config_));
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisAlertPublisher::~RedisAlertPublisher() = default;

core::Result<bool, core::Error> RedisAlertPublisher::publish(
    const std::vector<domain::QualityAlert>& alerts, const std::string& run_id) {
  using R = core::Result<bool, core::Error>;

  const std::string current_key = alerts_current_key(config_);
  const std::string stream_key = alerts_stream_key(config_);

  std::unordered_map<std::string, std::string> current;
  std::vector<std::vector<std::pair<std::string, std::string>>> entries;
  for (const auto& alert : alerts) {
    const std::string body = domain::quality_alert_to_json(alert).dump();
    current.emplace(alert.item_id.value, body);
    if (alert.risk_level != domain::RiskLevel::kOk) {
      entries.push_back({{"run_id", run_id},
                         {"item_id", alert.item_id.value},
                         {"risk_level", domain::risk_level_to_string(alert.risk_level)},
                         {"rule_id", alert.rule_id},
                         {"alert", body}});
    }
  }

  try {
    auto tx = redis_->transaction();
    tx.del(current_key);
    if (!current.empty()) {
      tx.hset(current_key, current.begin(), current.end());
    }
    for (const auto& fields : entries) {
      tx.xadd(stream_key, "*", fields.begin(), fields.end());
    }
    tx.exec();
  } catch (const std::exception& e) {
    return R::err(core::make_error(core::ErrorCode::kExternalServiceError,
                                   "redis publish failed: " + std::string(e.what())));
  }
  return R::ok(true);
}

RedisHealthResult redis_ping(const RedisFeedConfig& config) {
  try {
    sw::redis::Redis redis(connection_options(config));
    redis.ping();
    return RedisHealthResult{true, ""};
  } catch (const std::exception& e) {
    return RedisHealthResult{false, e.what()};
  }
}

}  // namespace prodsim::feed
