#pragma once

#include "shared/arg_parser.h"
#include "shared/runtime_config.h"

namespace prodsim::server {

// ServerConfig holds all parsed startup flags for prodsim_server.
struct ServerConfig {
  apps::RuntimeConfig runtime;   // NOLINT(readability-identifier-naming)
  bool refresh_on_start{false};  // NOLINT(readability-identifier-naming)
};

// Flags are reported to stderr as they are parsed; `valid` is false if any was rejected.
apps::ParsedOptions<ServerConfig> parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace prodsim::server
