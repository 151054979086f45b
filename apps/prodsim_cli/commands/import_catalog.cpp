#include "import_catalog.h"

#include "prodsim/app/app_service.h"
#include "prodsim/domain/json.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ImportCliConfig {
  prodsim::apps::RuntimeConfig runtime;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_import_catalog(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<ImportCliConfig>> options;
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: prodsim import-catalog <file.json> --db <path>\n";
    return 1;
  }
  if (!parsed.config.runtime.db_path.has_value()) {
    std::cerr << "Error: --db <path> is required; an in-memory import would be discarded\n";
    return 1;
  }

  const std::string& path = parsed.positionals.front();
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Error: cannot open " << path << "\n";
    return 1;
  }
  const auto document_json = nlohmann::json::parse(in, nullptr, false);
  if (document_json.is_discarded()) {
    std::cerr << "Error: " << path << " is not valid JSON\n";
    return 1;
  }
  auto document = prodsim::domain::catalog_from_json(document_json);
  if (!document.has_value()) {
    std::cerr << "Error: " << path << ": " << document.error() << "\n";
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  const auto response = prodsim::app::run_catalog_import(document.value(), runtime->services(),
                                                          runtime->id_gen(), runtime->clock());

  nlohmann::json out;
  out["trace_id"] = response.trace_id;
  out["items"] = response.items;
  out["reviews"] = response.reviews;
  std::cout << out.dump(2) << "\n";
  return 0;
}
