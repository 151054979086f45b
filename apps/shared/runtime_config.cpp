#include "runtime_config.h"

#include "prodsim/feed/redis_config.h"

#include <algorithm>

namespace prodsim::apps {

std::string validate_runtime_config(const RuntimeConfig& config) {
  const std::string store_error = storage::validate_store_config(config.store);
  if (!store_error.empty()) {
    return "Error: " + store_error;
  }

  if (config.ivf.num_lists == 0 || config.ivf.nprobe == 0 || config.ivf.max_iterations == 0) {
    return "Error: --num-lists, --nprobe and --kmeans-iterations must be at least 1";
  }

  const std::string refresh_error = indexing::validate_refresh_config(config.refresh);
  if (!refresh_error.empty()) {
    return "Error: " + refresh_error;
  }

  if (config.redis_uri.has_value() && !feed::parse_redis_uri(*config.redis_uri).has_value()) {
    return "Error: --redis URI '" + *config.redis_uri +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port/db, tcp://host";
  }

  if (config.redis_prefix.empty()) {
    return "Error: --redis-prefix must not be empty";
  }

  return "";
}

std::optional<std::vector<domain::Modality>> parse_modalities(const std::string& value) {
  std::vector<domain::Modality> modalities;
  std::size_t start = 0;
  while (start <= value.size()) {
    const std::size_t comma = value.find(',', start);
    const std::string token =
        value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    const auto modality = domain::modality_from_string(token);
    if (!modality.has_value()) {
      return std::nullopt;
    }
    if (std::find(modalities.begin(), modalities.end(), *modality) == modalities.end()) {
      modalities.push_back(*modality);
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return modalities;
}

}  // namespace prodsim::apps
