#pragma once

#include "config.h"
#include <string>

namespace prodsim::server {

// validate_server_config checks startup preconditions for prodsim_server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - embedding dimensions are non-zero
// - num_lists, nprobe and kmeans iterations are non-zero
// - rebuild_fraction is in (0, 1] and max_concurrency is non-zero
// - the retry policy is usable
// - if redis_uri is present, parse_redis_uri() must succeed
// - staleness threshold, when set, is non-zero
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace prodsim::server
