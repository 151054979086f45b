#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace prodsim::server::handlers {

// Throws RpcError(kInvalidRequest) when a cycle is already running.
// {"background": true} starts a cycle on the refresh worker and returns at once;
// otherwise the cycle runs inline and its summary is returned.
nlohmann::json handle_run_refresh(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_refresh_status(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_cancel_refresh(const nlohmann::json& params, ServerContext& ctx);

}  // namespace prodsim::server::handlers
