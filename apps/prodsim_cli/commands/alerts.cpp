#include "alerts.h"

#include "prodsim/app/app_service.h"
#include "prodsim/domain/json.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct AlertsCliConfig {
  prodsim::apps::RuntimeConfig runtime;  // NOLINT(readability-identifier-naming)
  prodsim::domain::RiskLevel min_level{
      prodsim::domain::RiskLevel::kMediumRisk};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_alerts(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<prodsim::apps::Option<AlertsCliConfig>> options = {
      {"--min-level", true, "Lowest risk level shown (default: MEDIUM_RISK)",
       [](AlertsCliConfig& c, const std::string& v) {
         const auto level = prodsim::domain::risk_level_from_string(v);
         if (!level.has_value()) {
           std::cerr << "Invalid --min-level: " << v
                     << " (valid: OK, MONITOR, MEDIUM_RISK, HIGH_RISK)\n";
           return false;
         }
         c.min_level = *level;
         return true;
       }},
  };
  prodsim::apps::add_runtime_options(options);
  auto parsed = prodsim::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }

  auto runtime = open_runtime(parsed.config.runtime);
  if (runtime == nullptr) {
    return 1;
  }

  const auto alerts = prodsim::app::fetch_quality_feed(parsed.config.min_level, runtime->services());
  nlohmann::json out;
  out["min_level"] = prodsim::domain::risk_level_to_string(parsed.config.min_level);
  out["alerts"] = nlohmann::json::array();
  for (const auto& alert : alerts) {
    out["alerts"].push_back(prodsim::domain::quality_alert_to_json(alert));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
