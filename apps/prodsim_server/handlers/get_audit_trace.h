#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace prodsim::server::handlers {

nlohmann::json handle_get_audit_trace(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_list_refresh_runs(const nlohmann::json& params, ServerContext& ctx);

}  // namespace prodsim::server::handlers
