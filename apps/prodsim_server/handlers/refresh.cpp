#include "refresh.h"

#include "prodsim/indexing/refresh_pipeline.h"

#include "params.h"

namespace prodsim::server::handlers {

using json = nlohmann::json;

namespace {

[[noreturn]] void throw_already_running() {
  throw RpcError(kInvalidRequest, "a refresh cycle is already running");
}

}  // namespace

json handle_run_refresh(const json& params, ServerContext& ctx) {
  if (optional_bool(params, "background", false)) {
    if (!ctx.refresher.start()) {
      throw_already_running();
    }
    return json{{"started", true}};
  }

  const auto result = ctx.refresher.run_now();
  if (!result.has_value()) {
    throw_already_running();
  }
  return indexing::refresh_result_to_json(*result);
}

json handle_refresh_status(const json& /*params*/, ServerContext& ctx) {
  json result;
  result["running"] = ctx.refresher.running();
  const auto last = ctx.refresher.last_result();
  result["last_result"] = last.has_value() ? indexing::refresh_result_to_json(*last) : json(nullptr);
  return result;
}

json handle_cancel_refresh(const json& /*params*/, ServerContext& ctx) {
  return json{{"cancel_requested", ctx.refresher.cancel()}};
}

}  // namespace prodsim::server::handlers
