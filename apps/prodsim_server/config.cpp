#include "config.h"

#include <string>
#include <vector>

namespace prodsim::server {

apps::ParsedOptions<ServerConfig> parse_args(int argc, char* argv[]) {
  std::vector<apps::Option<ServerConfig>> options = {
      {"--refresh-on-start", false, "Start a background refresh before serving requests",
       [](ServerConfig& c, const std::string& /*v*/) {
         c.refresh_on_start = true;
         return true;
       }},
  };
  apps::add_runtime_options(options);
  return apps::parse_options(argc, argv, options, 1);
}

}  // namespace prodsim::server
