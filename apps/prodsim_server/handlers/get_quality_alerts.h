#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace prodsim::server::handlers {

nlohmann::json handle_get_quality_alerts(const nlohmann::json& params, ServerContext& ctx);

}  // namespace prodsim::server::handlers
