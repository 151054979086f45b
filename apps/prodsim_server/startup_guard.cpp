#include "startup_guard.h"

namespace prodsim::server {

std::string validate_server_config(const ServerConfig& config) {
  const std::string runtime_error = apps::validate_runtime_config(config.runtime);
  if (!runtime_error.empty()) {
    return runtime_error;
  }

  const auto& threshold = config.runtime.recommendation.staleness_threshold;
  if (threshold.has_value() && threshold->count() == 0) {
    return "Error: --staleness-threshold-ms must be greater than 0 when set";
  }

  return "";
}

}  // namespace prodsim::server
