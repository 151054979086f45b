#include "cli_common.h"

#include <iostream>
#include <utility>

int report_error(const prodsim::core::Error& error) {
  std::cerr << "error: " << prodsim::core::to_string(error.code) << ": " << error.message << "\n";
  return 1;
}

std::unique_ptr<prodsim::apps::Runtime> open_runtime(const prodsim::apps::RuntimeConfig& config) {
  const std::string config_error = prodsim::apps::validate_runtime_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return nullptr;
  }

  auto runtime = prodsim::apps::Runtime::open(config);
  if (!runtime.has_value()) {
    std::cerr << runtime.error() << "\n";
    return nullptr;
  }
  if (!runtime.value()->persistent()) {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n";
  }
  return std::move(runtime.value());
}
