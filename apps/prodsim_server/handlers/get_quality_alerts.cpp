#include "get_quality_alerts.h"

#include "prodsim/app/app_service.h"
#include "prodsim/domain/json.h"
#include "prodsim/domain/quality.h"

#include "params.h"

namespace prodsim::server::handlers {

using json = nlohmann::json;

json handle_get_quality_alerts(const json& params, ServerContext& ctx) {
  domain::RiskLevel min_level = domain::RiskLevel::kMediumRisk;
  if (const auto level = optional_string(params, "min_level"); level.has_value()) {
    const auto parsed = domain::risk_level_from_string(*level);
    if (!parsed.has_value()) {
      throw RpcError(kInvalidParams, "Invalid min_level: " + *level);
    }
    min_level = *parsed;
  }

  json result;
  result["min_level"] = domain::risk_level_to_string(min_level);
  result["alerts"] = json::array();
  for (const auto& alert : app::fetch_quality_feed(min_level, ctx.services)) {
    result["alerts"].push_back(domain::quality_alert_to_json(alert));
  }
  return result;
}

}  // namespace prodsim::server::handlers
