#include "recommend.h"

#include "prodsim/app/app_service.h"
#include "prodsim/domain/json.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct RecommendCliConfig {
  prodsim::apps::RuntimeConfig runtime;                               // NOLINT(readability-identifier-naming)
  int k{10};                                                          // NOLINT(readability-identifier-naming)
  prodsim::domain::Modality modality{prodsim::domain::Modality::kText};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_recommend(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<RecommendCliConfig>> options = {
      {"--k", true, "Number of recommendations (default: 10)",
       [](RecommendCliConfig& c, const std::string& v) {
         return prodsim::apps::assign_number(c.k, "--k", v, prodsim::apps::parse_size_value);
       }},
      {"--modality", true, "Similarity space: text or image (default: text)",
       [](RecommendCliConfig& c, const std::string& v) {
         const auto modality = prodsim::domain::modality_from_string(v);
         if (!modality.has_value()) {
           std::cerr << "Invalid --modality: " << v << " (valid: text, image)\n";
           return false;
         }
         c.modality = *modality;
         return true;
       }},
  };
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: prodsim recommend <item_id> --db <path> [--k N]\n";
    return 1;
  }

  auto& config = parsed.config;
  // The queried modality must have an index.
  auto& modalities = config.runtime.refresh.modalities;
  if (std::find(modalities.begin(), modalities.end(), config.modality) == modalities.end()) {
    modalities.push_back(config.modality);
  }

  auto runtime = open_runtime(config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  prodsim::app::RecommendationRequest request;
  request.item_id = prodsim::core::ItemId{parsed.positionals.front()};
  request.k = config.k;
  request.modality = config.modality;

  const auto response = prodsim::app::run_recommendation(
      request, runtime->engine(), runtime->services(), runtime->id_gen(), runtime->clock());
  if (!response.result.has_value()) {
    return report_error(response.result.error());
  }

  auto out = prodsim::domain::recommendation_result_to_json(response.result.value());
  out["trace_id"] = response.trace_id;
  std::cout << out.dump(2) << "\n";
  return 0;
}
