#include "prodsim/core/clock.h"
#include "prodsim/core/hashing.h"
#include "prodsim/core/id_generator.h"
#include "prodsim/core/result.h"
#include "prodsim/core/text.h"

#include <catch2/catch_test_macros.hpp>

using namespace prodsim;

TEST_CASE("ID generators produce prefixed, ordered values", "[core][ids]") {
  SECTION("SystemIdGenerator") {
    core::SystemIdGenerator gen;
    const auto first = gen.next("run");
    const auto second = gen.next("run");
    CHECK(first.rfind("run-", 0) == 0);
    CHECK(first < second);
  }

  SECTION("DeterministicIdGenerator shares one counter across prefixes") {
    core::DeterministicIdGenerator gen;
    CHECK(gen.next("run") == "run-000001");
    CHECK(gen.next("evt") == "evt-000002");
    CHECK(gen.next("run") == "run-000003");
  }
}

TEST_CASE("FixedClock is driven explicitly", "[core][clock]") {
  core::FixedClock clock(1767225600000);
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
  clock.advance_millis(61000);
  CHECK(core::to_unix_millis(clock.now()) == 1767225661000);
  CHECK(clock.now_iso8601() == "2026-01-01T00:01:01Z");
  clock.set(0);
  CHECK(clock.now_iso8601() == "1970-01-01T00:00:00Z");
}

TEST_CASE("error codes have stable names", "[core][result]") {
  CHECK(core::to_string(core::ErrorCode::kNotFound) == "NotFound");
  CHECK(core::to_string(core::ErrorCode::kDimensionMismatch) == "DimensionMismatch");
  CHECK(core::to_string(core::ErrorCode::kInvalidConfig) == "InvalidConfig");
  CHECK(core::to_string(core::ErrorCode::kExternalServiceError) == "ExternalServiceError");
  CHECK(core::to_string(core::ErrorCode::kIndexStaleness) == "IndexStaleness");
  CHECK(core::to_string(core::ErrorCode::kCancelled) == "Cancelled");

  const auto ok = core::Result<int, core::Error>::ok(3);
  CHECK(ok.has_value());
  const auto err = core::Result<int, core::Error>::err(core::make_error(core::ErrorCode::kNotFound, "x"));
  CHECK_FALSE(err.has_value());
  CHECK(err.error().message == "x");
}

TEST_CASE("ASCII text helpers", "[core][text]") {
  CHECK(core::trim_ascii("  \t0.75\r\n") == "0.75");
  CHECK(core::trim_ascii("   ").empty());
  CHECK(core::tokenize_ascii("Steel KETTLE, 1.7l / kitchen") ==
        std::vector<std::string>{"steel", "kettle", "7l", "kitchen"});
  CHECK(core::tokenize_ascii("a b cd", 1) == std::vector<std::string>{"a", "b", "cd"});
}

TEST_CASE("stable hashing", "[core][hashing]") {
  // FNV-1a reference values.
  CHECK(core::stable_hash64("") == 14695981039346656037ull);
  CHECK(core::stable_hash64_hex("a") == "af63dc4c8601ec8c");
  CHECK(core::vector_fingerprint({1.0f, 2.0f}) == core::vector_fingerprint({1.0f, 2.0f}));
  CHECK(core::vector_fingerprint({1.0f, 2.0f}) != core::vector_fingerprint({2.0f, 1.0f}));
}
