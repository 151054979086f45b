#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "refresh_worker.h"
#include "server_context.h"
#include "server_loop.h"
#include "shared/runtime.h"

#include <sstream>
#include <string>
#include <vector>

using namespace prodsim;
using json = nlohmann::json;

namespace {

// Runs the loop over `lines` against an ephemeral runtime seeded with three items.
std::vector<json> exchange(const std::vector<std::string>& lines) {
  server::ServerConfig config;
  auto opened = apps::Runtime::open(config.runtime);
  REQUIRE(opened.has_value());
  auto& rt = *opened.value();

  for (const auto* id : {"lamp", "lantern", "mug"}) {
    domain::Item item;
    item.item_id = core::ItemId{id};
    item.name = id;
    item.category = std::string(id) == "mug" ? "kitchen" : "lighting";
    item.description = "a " + std::string(id);
    rt.services().catalog.upsert(item);
  }
  for (int i = 0; i < 4; ++i) {
    rt.services().reviews.append({core::ItemId{"mug"}, 1.0, "0.1"});
  }

  server::RefreshWorker refresher(rt.pipeline());
  server::ServerContext ctx{rt.services(), rt.engine(), refresher, rt.id_gen(), rt.clock(),
                            config};

  std::ostringstream input;
  for (const auto& line : lines) {
    input << line << "\n";
  }
  std::istringstream in(input.str());
  std::ostringstream out;
  server::run_server_loop(ctx, in, out);

  std::vector<json> responses;
  std::istringstream reader(out.str());
  std::string line;
  while (std::getline(reader, line)) {
    responses.push_back(json::parse(line));
  }
  return responses;
}

std::string call(int id, const std::string& tool, const json& arguments = json::object()) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "tools/call"},
              {"params", {{"name", tool}, {"arguments", arguments}}}}
      .dump();
}

}  // namespace

TEST_CASE("server loop: initialize and tools/list", "[server]") {
  const auto responses = exchange({R"({"jsonrpc":"2.0","id":1,"method":"initialize"})",
                                   R"({"jsonrpc":"2.0","id":"two","method":"tools/list"})"});
  REQUIRE(responses.size() == 2);
  CHECK(responses[0]["id"] == 1);
  CHECK(responses[0]["result"]["serverInfo"]["name"] == "prodsim");
  CHECK(responses[1]["id"] == "two");

  std::vector<std::string> names;
  for (const auto& tool : responses[1]["result"]["tools"]) {
    names.push_back(tool["name"].get<std::string>());
    CHECK(tool.contains("inputSchema"));
  }
  CHECK(names == std::vector<std::string>{"get_recommendations", "get_quality_alerts",
                                          "run_refresh", "refresh_status", "cancel_refresh",
                                          "list_refresh_runs", "get_audit_trace"});
}

TEST_CASE("server loop: protocol errors", "[server]") {
  const auto responses = exchange({"{not json",
                                   "",
                                   R"({"jsonrpc":"2.0","id":3})",
                                   R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})",
                                   call(5, "no_such_tool"),
                                   R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{}})"});
  REQUIRE(responses.size() == 5);
  CHECK(responses[0]["error"]["code"] == server::kParseError);
  CHECK(responses[0]["id"].is_null());
  CHECK(responses[1]["error"]["code"] == server::kInvalidRequest);
  CHECK(responses[2]["error"]["code"] == server::kMethodNotFound);
  CHECK(responses[3]["error"]["code"] == server::kInvalidParams);
  CHECK(responses[4]["error"]["code"] == server::kInvalidParams);
}

TEST_CASE("server loop: integer arguments outside int range are rejected", "[server]") {
  const auto responses =
      exchange({R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_recommendations","arguments":{"item_id":"lamp","k":4294967297}}})",
                R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"get_recommendations","arguments":{"item_id":"lamp","k":-4294967296}}})",
                R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"get_recommendations","arguments":{"item_id":"lamp","k":18446744073709551615}}})"});
  REQUIRE(responses.size() == 3);
  for (const auto& response : responses) {
    CHECK(response["error"]["code"] == server::kInvalidParams);
    CHECK_FALSE(response.contains("result"));
  }
}

TEST_CASE("server loop: refresh then recommend", "[server]") {
  const auto responses =
      exchange({call(1, "get_recommendations", {{"item_id", "lamp"}, {"k", 2}}),
                call(2, "run_refresh"),
                call(3, "get_recommendations", {{"item_id", "lamp"}, {"k", 2}, {"trace_id", "t-1"}}),
                call(4, "get_audit_trace", {{"trace_id", "t-1"}}),
                call(5, "get_quality_alerts"),
                call(6, "refresh_status"),
                call(7, "list_refresh_runs"),
                call(8, "get_recommendations", {{"item_id", "lamp"}, {"modality", "audio"}})});
  REQUIRE(responses.size() == 8);

  // Nothing embedded yet.
  CHECK(responses[0]["result"]["error"]["code"] == "NotFound");

  const auto& refresh = responses[1]["result"];
  CHECK(refresh["status"] == "completed");
  CHECK(refresh["embedded"] == 3);
  CHECK(refresh["alerts_by_level"]["HIGH_RISK"] == 1);

  const auto& recs = responses[2]["result"];
  CHECK(recs["trace_id"] == "t-1");
  CHECK(recs["anchor"] == "lamp");
  REQUIRE(recs["recommendations"].size() == 2);
  for (const auto& rec : recs["recommendations"]) {
    CHECK(rec["item_id"] != "lamp");
  }

  const auto& trace = responses[3]["result"]["events"];
  REQUIRE(trace.size() == 1);
  CHECK(trace[0]["event_type"] == "RecommendationServed");

  const auto& alerts = responses[4]["result"];
  CHECK(alerts["min_level"] == "MEDIUM_RISK");
  REQUIRE(alerts["alerts"].size() == 1);
  CHECK(alerts["alerts"][0]["item_id"] == "mug");

  CHECK(responses[5]["result"]["running"] == false);
  CHECK(responses[5]["result"]["last_result"]["status"] == "completed");

  REQUIRE(responses[6]["result"]["runs"].size() == 1);
  CHECK(responses[6]["result"]["runs"][0]["status"] == "completed");

  CHECK(responses[7]["error"]["code"] == server::kInvalidParams);
}
