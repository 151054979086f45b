#include "audit.h"

#include "prodsim/app/app_service.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <iostream>
#include <vector>

namespace {

struct AuditCliConfig {
  prodsim::apps::RuntimeConfig runtime;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<AuditCliConfig>> options;
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: prodsim audit <trace_id> --db <path>\n";
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  const std::string& trace_id = parsed.positionals.front();
  const auto events = prodsim::app::fetch_audit_trace(trace_id, runtime->services());
  if (events.empty()) {
    return report_error(prodsim::core::make_error(prodsim::core::ErrorCode::kNotFound,
                                                  "no audit events for trace " + trace_id));
  }

  nlohmann::json out;
  out["trace_id"] = trace_id;
  out["events"] = nlohmann::json::array();
  for (const auto& event : events) {
    out["events"].push_back(prodsim::app::audit_event_to_json(event));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_runs(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<AuditCliConfig>> options;
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto& run : prodsim::app::list_refresh_runs(runtime->services())) {
    out.push_back(prodsim::app::refresh_run_to_json(run));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
