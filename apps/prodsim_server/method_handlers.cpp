#include "method_handlers.h"

#include "prodsim/core/version.h"

#include "handlers/tool_registry.h"

namespace prodsim::server {

using json = nlohmann::json;

namespace {

json tool(const std::string& name, const std::string& description, json properties,
          json required = json::array()) {
  return {
      {"name", name},
      {"description", description},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", std::move(properties)},
           {"required", std::move(required)},
       }},
  };
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "prodsim"}, {"version", core::kVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back(tool("get_recommendations",
                       "Items most similar to item_id, nearest first, never including item_id",
                       {
                           {"item_id", {{"type", "string"}}},
                           {"k", {{"type", "number"}, {"description", "Default: 10"}}},
                           {"modality",
                            {{"type", "string"}, {"enum", json::array({"text", "image"})}}},
                           {"trace_id", {{"type", "string"}}},
                       },
                       json::array({"item_id"})));

  tools.push_back(tool("get_quality_alerts", "Current quality alerts, most severe first",
                       {
                           {"min_level",
                            {{"type", "string"},
                             {"enum", json::array({"OK", "MONITOR", "MEDIUM_RISK", "HIGH_RISK"})},
                             {"description", "Default: MEDIUM_RISK"}}},
                       }));

  tools.push_back(tool("run_refresh",
                       "Run one refresh cycle: embed stale items, update indexes, regenerate "
                       "alerts",
                       {
                           {"background",
                            {{"type", "boolean"},
                             {"description", "Return immediately and refresh on a worker "
                                             "thread (default: false)"}}},
                       }));

  tools.push_back(tool("refresh_status", "Whether a refresh is running, and the last result",
                       json::object()));

  tools.push_back(tool("cancel_refresh", "Ask the running refresh to stop", json::object()));

  tools.push_back(tool("list_refresh_runs", "Recorded refresh runs, oldest first", json::object()));

  tools.push_back(tool("get_audit_trace", "Fetch audit events by trace_id or refresh run_id",
                       {{"trace_id", {{"type", "string"}}}}, json::array({"trace_id"})));

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const auto name = req.params.find("name");
  if (name == req.params.end() || !name->is_string()) {
    throw RpcError(kInvalidParams, "tools/call requires a string 'name'");
  }
  const std::string tool_name = name->get<std::string>();
  const json tool_params = req.params.value("arguments", json::object());
  if (!tool_params.is_object()) {
    throw RpcError(kInvalidParams, "'arguments' must be an object");
  }

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    throw RpcError(kInvalidParams, "Unknown tool: " + tool_name);
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace prodsim::server
