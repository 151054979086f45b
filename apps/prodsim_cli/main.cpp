#include "prodsim/core/version.h"

#include "commands/alerts.h"
#include "commands/audit.h"
#include "commands/embeddings.h"
#include "commands/feed_health.h"
#include "commands/import_catalog.h"
#include "commands/recommend.h"
#include "commands/refresh.h"
#include "shared/runtime_config.h"
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

using Command = int (*)(int, char**);

struct HelpConfig {
  prodsim::apps::RuntimeConfig runtime;  // NOLINT(readability-identifier-naming)
};

void print_usage() {
  std::cerr << "prodsim " << prodsim::core::kVersion << "\n\n"
            << "Usage: prodsim <command> [options]\n\n"
            << "Commands:\n"
            << "  import-catalog <file.json>  Load items and reviews into the catalog tables\n"
            << "  refresh                     Run one refresh cycle\n"
            << "  recommend <item_id>         Similar items for <item_id>\n"
            << "  alerts                      Current quality alerts, most severe first\n"
            << "  audit <trace_id>            Audit events of a run or request\n"
            << "  runs                        Recorded refresh runs\n"
            << "  embeddings <item_id>        Embedding versions; --rollback restores the last\n"
            << "  feed-health                 PING the Redis quality feed\n\n"
            << "Shared options:\n";
  std::vector<prodsim::apps::Option<HelpConfig>> options;
  prodsim::apps::add_runtime_options(options);
  prodsim::apps::print_options(std::cerr, options);
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::unordered_map<std::string, Command> commands = {
      {"import-catalog", cmd_import_catalog},
      {"refresh", cmd_refresh},
      {"recommend", cmd_recommend},
      {"alerts", cmd_alerts},
      {"audit", cmd_audit},
      {"runs", cmd_runs},
      {"embeddings", cmd_embeddings},
      {"feed-health", cmd_feed_health},
  };

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string name = argv[1];
  if (name == "--help" || name == "-h" || name == "help") {
    print_usage();
    return 0;
  }

  const auto it = commands.find(name);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << name << "\n\n";
    print_usage();
    return 1;
  }
  return it->second(argc, argv);
}
