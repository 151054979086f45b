#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"

using namespace prodsim::server;
using namespace std::chrono_literals;

// ── Defaults ────────────────────────────────────────────────────────────────

TEST_CASE("validate_server_config: defaults are valid", "[startup][config]") {
  ServerConfig config;
  CHECK(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: valid redis URI is accepted", "[startup][config]") {
  ServerConfig config;
  config.runtime.redis_uri = "redis://127.0.0.1:6379/1";
  CHECK(validate_server_config(config).empty());
}

// ── Rejections ──────────────────────────────────────────────────────────────

TEST_CASE("validate_server_config: zero embedding dimension", "[startup][config]") {
  ServerConfig config;
  config.runtime.store.image_dim = 0;
  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: zero index options", "[startup][config]") {
  ServerConfig config;
  SECTION("num_lists") { config.runtime.ivf.num_lists = 0; }
  SECTION("nprobe") { config.runtime.ivf.nprobe = 0; }
  SECTION("kmeans iterations") { config.runtime.ivf.max_iterations = 0; }
  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: refresh settings", "[startup][config]") {
  ServerConfig config;
  SECTION("rebuild fraction above 1") { config.runtime.refresh.rebuild_fraction = 1.5; }
  SECTION("no workers") { config.runtime.refresh.max_concurrency = 0; }
  SECTION("backoff cap below initial") {
    config.runtime.refresh.retry.initial_backoff = 500ms;
    config.runtime.refresh.retry.max_backoff = 100ms;
  }
  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: malformed redis URI", "[startup][config]") {
  ServerConfig config;
  config.runtime.redis_uri = "localhost:6379";
  const auto error = validate_server_config(config);
  CHECK(error.find("not a valid Redis URI") != std::string::npos);
}

TEST_CASE("validate_server_config: empty redis prefix", "[startup][config]") {
  ServerConfig config;
  config.runtime.redis_prefix = "";
  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: zero staleness threshold", "[startup][config]") {
  ServerConfig config;
  config.runtime.recommendation.staleness_threshold = 0ms;
  CHECK_FALSE(validate_server_config(config).empty());

  config.runtime.recommendation.staleness_threshold = 60000ms;
  CHECK(validate_server_config(config).empty());
}

// ── Flag parsing ────────────────────────────────────────────────────────────

TEST_CASE("parse_args: shared runtime flags", "[startup][args]") {
  std::vector<std::string> args = {"prodsim_server", "--db",          "/tmp/prodsim.db",
                                   "--modalities",   "text,image",    "--nprobe",
                                   "16",             "--max-distance", "0.4",
                                   "--refresh-on-start"};
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }

  const auto parsed = parse_args(static_cast<int>(argv.size()), argv.data());
  REQUIRE(parsed.valid);
  CHECK(parsed.positionals.empty());
  CHECK(parsed.config.refresh_on_start);
  CHECK(parsed.config.runtime.db_path == std::optional<std::string>("/tmp/prodsim.db"));
  CHECK(parsed.config.runtime.refresh.modalities.size() == 2);
  CHECK(parsed.config.runtime.ivf.nprobe == 16);
  REQUIRE(parsed.config.runtime.recommendation.max_distance.has_value());
  CHECK(*parsed.config.runtime.recommendation.max_distance == 0.4);
}

TEST_CASE("parse_args: rejected values clear valid", "[startup][args]") {
  std::vector<std::string> args = {"prodsim_server", "--nprobe", "-3", "--modalities", "audio",
                                   "--bogus"};
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  CHECK_FALSE(parse_args(static_cast<int>(argv.size()), argv.data()).valid);
}

TEST_CASE("parse_modalities", "[startup][args]") {
  using prodsim::domain::Modality;
  CHECK(prodsim::apps::parse_modalities("image") == std::vector<Modality>{Modality::kImage});
  CHECK(prodsim::apps::parse_modalities("text,image,text") ==
        std::vector<Modality>{Modality::kText, Modality::kImage});
  CHECK_FALSE(prodsim::apps::parse_modalities("").has_value());
  CHECK_FALSE(prodsim::apps::parse_modalities("text,").has_value());
}
