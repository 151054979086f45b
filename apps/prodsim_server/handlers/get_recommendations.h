#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace prodsim::server::handlers {

// Query errors (unknown item, unindexed item, invalid k) are returned as a tool
// result with an "error" object, not as a JSON-RPC error.
nlohmann::json handle_get_recommendations(const nlohmann::json& params, ServerContext& ctx);

}  // namespace prodsim::server::handlers
