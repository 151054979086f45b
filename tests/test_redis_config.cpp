#include "prodsim/feed/redis_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace prodsim::feed;

TEST_CASE("parse_redis_uri accepts tcp and redis schemes", "[feed][redis][config]") {
  auto tcp = parse_redis_uri("tcp://127.0.0.1:6380");
  REQUIRE(tcp.has_value());
  CHECK(tcp->host == "127.0.0.1");
  CHECK(tcp->port == 6380);
  CHECK(tcp->db == 0);
  CHECK(tcp->uri == "tcp://127.0.0.1:6380");

  auto redis = parse_redis_uri("redis://cache.internal:6379/3");
  REQUIRE(redis.has_value());
  CHECK(redis->host == "cache.internal");
  CHECK(redis->db == 3);

  auto bare = parse_redis_uri("tcp://localhost");
  REQUIRE(bare.has_value());
  CHECK(bare->port == 6379);
}

TEST_CASE("parse_redis_uri rejects malformed input", "[feed][redis][config]") {
  CHECK_FALSE(parse_redis_uri("").has_value());
  CHECK_FALSE(parse_redis_uri("http://localhost:6379").has_value());
  CHECK_FALSE(parse_redis_uri("localhost:6379").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://:6379").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:0").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:65536").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:abc").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:6379/x").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:6379/").has_value());
}

TEST_CASE("log string and key names", "[feed][redis][config]") {
  auto config = parse_redis_uri("redis://10.0.0.5:7000/2");
  REQUIRE(config.has_value());
  CHECK(redis_config_to_log_string(*config) == "10.0.0.5:7000/2");

  config->key_prefix = "shop";
  CHECK(alerts_current_key(*config) == "shop:alerts:current");
  CHECK(alerts_stream_key(*config) == "shop:alerts:stream");
}
