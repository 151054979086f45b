#include "embeddings.h"

#include "prodsim/app/app_service.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct EmbeddingsCliConfig {
  prodsim::apps::RuntimeConfig runtime;                                  // NOLINT(readability-identifier-naming)
  prodsim::domain::Modality modality{prodsim::domain::Modality::kText};  // NOLINT(readability-identifier-naming)
  bool rollback{false};                                                  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_embeddings(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<EmbeddingsCliConfig>> options = {
      {"--modality", true, "Embedding space: text or image (default: text)",
       [](EmbeddingsCliConfig& c, const std::string& v) {
         const auto modality = prodsim::domain::modality_from_string(v);
         if (!modality.has_value()) {
           std::cerr << "Invalid --modality: " << v << " (valid: text, image)\n";
           return false;
         }
         c.modality = *modality;
         return true;
       }},
      {"--rollback", false, "Restore the newest retired version as current",
       [](EmbeddingsCliConfig& c, const std::string& /*v*/) {
         c.rollback = true;
         return true;
       }},
  };
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: prodsim embeddings <item_id> --db <path> [--modality M] [--rollback]\n";
    return 1;
  }
  if (!parsed.config.runtime.db_path.has_value()) {
    std::cerr << "Error: embeddings requires --db; ephemeral stores have no history\n";
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  const prodsim::core::ItemId item_id{parsed.positionals.front()};
  const auto modality = parsed.config.modality;
  auto& services = runtime->services();

  nlohmann::json out;
  if (parsed.config.rollback) {
    const auto response = prodsim::app::run_embedding_rollback(item_id, modality, services,
                                                               runtime->id_gen(), runtime->clock());
    if (!response.restored.has_value()) {
      return report_error(response.restored.error());
    }
    out["trace_id"] = response.trace_id;
    out["restored"] = prodsim::app::embedding_to_json(response.restored.value());
  } else {
    const auto current = services.embeddings.get(item_id, modality);
    if (!current.has_value()) {
      return report_error(current.error());
    }
    out["current"] = prodsim::app::embedding_to_json(current.value());
  }

  out["retired"] = nlohmann::json::array();
  for (const auto& embedding : prodsim::app::fetch_embedding_history(item_id, modality, services)) {
    out["retired"].push_back(prodsim::app::embedding_to_json(embedding));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
