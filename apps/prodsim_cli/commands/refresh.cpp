#include "refresh.h"

#include "prodsim/core/cancellation.h"
#include "prodsim/indexing/refresh_pipeline.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <iostream>
#include <vector>

namespace {

struct RefreshCliConfig {
  prodsim::apps::RuntimeConfig runtime;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_refresh(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<RefreshCliConfig>> options;
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  const prodsim::core::CancellationToken never_cancelled;
  const auto result = runtime->pipeline().run_cycle(never_cancelled);
  std::cout << prodsim::indexing::refresh_result_to_json(result).dump(2) << "\n";

  if (result.error.has_value()) {
    return report_error(*result.error);
  }
  if (!result.failures.empty()) {
    std::cerr << result.failures.size()
              << " item(s) failed to embed and will be retried on the next refresh\n";
  }
  return result.status == prodsim::indexing::RefreshRunStatus::kCompleted ? 0 : 1;
}
