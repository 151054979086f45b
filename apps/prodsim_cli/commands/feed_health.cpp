#include "feed_health.h"

#include "prodsim/feed/redis_alert_publisher.h"
#include "prodsim/feed/redis_config.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct FeedHealthCliConfig {
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_feed_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<prodsim::apps::Option<FeedHealthCliConfig>> options = {
      {"--redis", true, "Redis URI (e.g. tcp://127.0.0.1:6379)",
       [](FeedHealthCliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return true;
       }},
  };
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }

  if (!parsed.config.redis_uri.has_value()) {
    std::cerr << "Error: --redis <uri> is required\n";
    return 1;
  }

  const auto feed_config = prodsim::feed::parse_redis_uri(parsed.config.redis_uri.value());
  if (!feed_config.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << parsed.config.redis_uri.value() << "'\n"
              << "Accepted formats: tcp://host:port, redis://host:port/db, tcp://host\n";
    return 1;
  }

  const auto result = prodsim::feed::redis_ping(feed_config.value());
  if (result.ok) {
    std::cout << "OK: Redis reachable at "
              << prodsim::feed::redis_config_to_log_string(feed_config.value()) << "\n";
    return 0;
  }

  std::cerr << "ERROR: " << result.error << "\n";
  return 1;
}
