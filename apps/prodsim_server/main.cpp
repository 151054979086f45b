#include "prodsim/core/version.h"
#include "prodsim/feed/redis_config.h"

#include "config.h"
#include "refresh_worker.h"
#include "server_context.h"
#include "server_loop.h"
#include "shared/runtime.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <string>

using namespace prodsim;

int main(int argc, char* argv[]) {
  auto parsed = server::parse_args(argc, argv);
  if (!parsed.valid) {
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return 1;
  }
  const server::ServerConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "prodsim MCP Server v" << core::kVersion << "\n";

  if (config.runtime.db_path.has_value()) {
    std::cerr << "Storage:     SQLite -- " << config.runtime.db_path.value() << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         Catalog, embeddings, alerts and the audit log will be LOST on\n"
                 "         process exit. Pass --db <path> to enable persistence.\n";
  }

  if (config.runtime.redis_uri.has_value()) {
    // Validated above.
    const auto redis_cfg = feed::parse_redis_uri(config.runtime.redis_uri.value());
    std::cerr << "Alert feed:  Redis -- " << feed::redis_config_to_log_string(redis_cfg.value())
              << " (prefix " << config.runtime.redis_prefix << ")\n";
  } else {
    std::cerr << "Alert feed:  disabled (pass --redis <uri> to publish alerts)\n";
  }
  // ─────────────────────────────────────────────────────────────────────────

  auto runtime_result = apps::Runtime::open(config.runtime);
  if (!runtime_result.has_value()) {
    std::cerr << runtime_result.error() << "\n";
    return 1;
  }
  auto& runtime = *runtime_result.value();

  server::RefreshWorker refresher(runtime.pipeline());
  if (config.refresh_on_start) {
    std::cerr << "Refresh:     background cycle started\n";
    refresher.start();
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";

  server::ServerContext ctx{runtime.services(), runtime.engine(), refresher,
                            runtime.id_gen(),   runtime.clock(),  config};
  try {
    server::run_server_loop(ctx, std::cin, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
