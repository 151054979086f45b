#include "tool_registry.h"

#include "get_audit_trace.h"
#include "get_quality_alerts.h"
#include "get_recommendations.h"
#include "refresh.h"

namespace prodsim::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"get_recommendations", handle_get_recommendations},
      {"get_quality_alerts", handle_get_quality_alerts},
      {"run_refresh", handle_run_refresh},
      {"refresh_status", handle_refresh_status},
      {"cancel_refresh", handle_cancel_refresh},
      {"get_audit_trace", handle_get_audit_trace},
      {"list_refresh_runs", handle_list_refresh_runs},
  };
}

}  // namespace prodsim::server::handlers
