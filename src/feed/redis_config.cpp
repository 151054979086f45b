#include "prodsim/feed/redis_config.h"

#include <string_view>

namespace prodsim::feed {

namespace {

// Non-empty, decimal digits only, and at most `max`.
std::optional<int> parse_bounded_int(std::string_view digits, int max) {
  if (digits.empty() || digits.size() > 5) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value > max) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisFeedConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view rest;

  if (view.starts_with("tcp://")) {
    rest = view.substr(6);
  } else if (view.starts_with("redis://")) {
    rest = view.substr(8);
  } else {
    return std::nullopt;
  }

  RedisFeedConfig config;
  config.uri = uri;

  const auto slash_pos = rest.find('/');
  if (slash_pos != std::string_view::npos) {
    const auto db = parse_bounded_int(rest.substr(slash_pos + 1), 65535);
    if (!db.has_value()) {
      return std::nullopt;
    }
    config.db = *db;
    rest = rest.substr(0, slash_pos);
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = rest.rfind(':');
  if (colon_pos == std::string_view::npos) {
    config.host = std::string{rest};
  } else {
    config.host = std::string{rest.substr(0, colon_pos)};
    const auto port = parse_bounded_int(rest.substr(colon_pos + 1), 65535);
    if (!port.has_value() || *port < 1) {
      return std::nullopt;
    }
    config.port = *port;
  }

  if (config.host.empty()) {
    return std::nullopt;
  }
  return config;
}

std::string redis_config_to_log_string(const RedisFeedConfig& config) {
  return config.host + ":" + std::to_string(config.port) + "/" + std::to_string(config.db);
}

std::string alerts_current_key(const RedisFeedConfig& config) {
  return config.key_prefix + ":alerts:current";
}

std::string alerts_stream_key(const RedisFeedConfig& config) {
  return config.key_prefix + ":alerts:stream";
}

}  // namespace prodsim::feed
