#include "get_audit_trace.h"

#include "prodsim/app/app_service.h"

#include "params.h"
#include <string>

namespace prodsim::server::handlers {

using json = nlohmann::json;

json handle_get_audit_trace(const json& params, ServerContext& ctx) {
  const std::string trace_id = required_string(params, "trace_id");

  json result;
  result["trace_id"] = trace_id;
  result["events"] = json::array();
  for (const auto& event : app::fetch_audit_trace(trace_id, ctx.services)) {
    result["events"].push_back(app::audit_event_to_json(event));
  }
  return result;
}

json handle_list_refresh_runs(const json& /*params*/, ServerContext& ctx) {
  json result;
  result["runs"] = json::array();
  for (const auto& run : app::list_refresh_runs(ctx.services)) {
    result["runs"].push_back(app::refresh_run_to_json(run));
  }
  return result;
}

}  // namespace prodsim::server::handlers
