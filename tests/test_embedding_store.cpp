#include "prodsim/core/clock.h"
#include "prodsim/storage/inmemory_embedding_store.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace prodsim;
using domain::Modality;

namespace {

storage::EmbeddingStoreConfig small_config() {
  return storage::EmbeddingStoreConfig{3, 2, 2};
}

}  // namespace

TEST_CASE("InMemoryEmbeddingStore rejects zero dimensions", "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  CHECK_THROWS_AS(storage::InMemoryEmbeddingStore({0, 2, 2}, clock), std::invalid_argument);
  CHECK_THROWS_AS(storage::InMemoryEmbeddingStore({3, 0, 2}, clock), std::invalid_argument);
}

TEST_CASE("upsert then get returns the current embedding", "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);

  auto written = store.upsert(core::ItemId{"sku-1"}, Modality::kText, {1.0f, 0.0f, 0.0f}, "stub/v1");
  REQUIRE(written.has_value());
  CHECK(written.value().version == 1);
  CHECK(written.value().current);
  CHECK(written.value().dim == 3);

  auto got = store.get(core::ItemId{"sku-1"}, Modality::kText);
  REQUIRE(got.has_value());
  CHECK(got.value().vector == vector::Vector{1.0f, 0.0f, 0.0f});
  CHECK(got.value().source_version == "stub/v1");
  CHECK(core::to_unix_millis(got.value().created_at) == 1000);

  auto other_modality = store.get(core::ItemId{"sku-1"}, Modality::kImage);
  REQUIRE_FALSE(other_modality.has_value());
  CHECK(other_modality.error().code == core::ErrorCode::kNotFound);
}

TEST_CASE("wrong dimension is rejected and the prior version survives",
          "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);
  REQUIRE(store.upsert(core::ItemId{"sku-1"}, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1").has_value());

  auto bad = store.upsert(core::ItemId{"sku-1"}, Modality::kText, {1.0f, 0.0f}, "v2");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == core::ErrorCode::kDimensionMismatch);

  auto got = store.get(core::ItemId{"sku-1"}, Modality::kText);
  REQUIRE(got.has_value());
  CHECK(got.value().source_version == "v1");
  CHECK(store.generation() == 1);
}

TEST_CASE("image modality uses its own dimension", "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);

  CHECK(store.upsert(core::ItemId{"sku-1"}, Modality::kImage, {0.5f, 0.5f}, "v1").has_value());
  CHECK_FALSE(store.upsert(core::ItemId{"sku-1"}, Modality::kImage, {0.5f, 0.5f, 0.5f}, "v1")
                  .has_value());
}

TEST_CASE("upsert_batch is all-or-nothing", "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);

  const std::vector<storage::EmbeddingWrite> writes = {
      {core::ItemId{"a"}, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1"},
      {core::ItemId{"b"}, Modality::kText, {1.0f, 0.0f}, "v1"},
  };
  auto result = store.upsert_batch(writes);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kDimensionMismatch);
  CHECK_FALSE(store.get(core::ItemId{"a"}, Modality::kText).has_value());
  CHECK(store.generation() == 0);
}

TEST_CASE("versions increase and superseded versions are retained up to the limit",
          "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);
  const core::ItemId id{"sku-1"};

  for (int i = 1; i <= 4; ++i) {
    const float x = static_cast<float>(i);
    REQUIRE(store.upsert(id, Modality::kText, {x, 0.0f, 0.0f}, "v" + std::to_string(i)).has_value());
  }

  auto current = store.get(id, Modality::kText);
  REQUIRE(current.has_value());
  CHECK(current.value().version == 4);
  CHECK(current.value().source_version == "v4");

  const auto history = store.history(id, Modality::kText);
  REQUIRE(history.size() == 2);
  CHECK(history[0].source_version == "v3");
  CHECK(history[1].source_version == "v2");
  CHECK_FALSE(history[0].current);
}

TEST_CASE("rollback republishes the newest retired version", "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);
  const core::ItemId id{"sku-1"};

  SECTION("nothing to roll back to") {
    CHECK(store.rollback(id, Modality::kText).error().code == core::ErrorCode::kNotFound);
    REQUIRE(store.upsert(id, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1").has_value());
    CHECK(store.rollback(id, Modality::kText).error().code == core::ErrorCode::kNotFound);
  }

  SECTION("walks back one version at a time") {
    REQUIRE(store.upsert(id, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1").has_value());
    REQUIRE(store.upsert(id, Modality::kText, {0.0f, 1.0f, 0.0f}, "v2").has_value());
    REQUIRE(store.upsert(id, Modality::kText, {0.0f, 0.0f, 1.0f}, "v3").has_value());

    auto first = store.rollback(id, Modality::kText);
    REQUIRE(first.has_value());
    CHECK(first.value().source_version == "v2");
    CHECK(first.value().version == 4);

    auto second = store.rollback(id, Modality::kText);
    REQUIRE(second.has_value());
    CHECK(second.value().source_version == "v1");
    CHECK(store.get(id, Modality::kText).value().vector == vector::Vector{1.0f, 0.0f, 0.0f});
  }
}

TEST_CASE("is_stale compares creation time with catalog modification",
          "[storage][embedding-store]") {
  core::FixedClock clock(5000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);
  const core::ItemId id{"sku-1"};

  CHECK(store.is_stale(id, Modality::kText, core::from_unix_millis(0)));

  REQUIRE(store.upsert(id, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1").has_value());
  CHECK_FALSE(store.is_stale(id, Modality::kText, core::from_unix_millis(4000)));
  CHECK_FALSE(store.is_stale(id, Modality::kText, core::from_unix_millis(5000)));
  CHECK(store.is_stale(id, Modality::kText, core::from_unix_millis(6000)));
}

TEST_CASE("snapshot lists current embeddings of one modality by item_id",
          "[storage][embedding-store]") {
  core::FixedClock clock(1000);
  storage::InMemoryEmbeddingStore store(small_config(), clock);

  REQUIRE(store.upsert(core::ItemId{"c"}, Modality::kText, {1.0f, 0.0f, 0.0f}, "v1").has_value());
  REQUIRE(store.upsert(core::ItemId{"a"}, Modality::kText, {0.0f, 1.0f, 0.0f}, "v1").has_value());
  REQUIRE(store.upsert(core::ItemId{"b"}, Modality::kImage, {1.0f, 0.0f}, "v1").has_value());
  REQUIRE(store.upsert(core::ItemId{"a"}, Modality::kText, {0.0f, 0.0f, 1.0f}, "v2").has_value());

  const auto snap = store.snapshot(Modality::kText);
  CHECK(snap.generation == 4);
  REQUIRE(snap.embeddings.size() == 2);
  CHECK(snap.embeddings[0].item_id.value == "a");
  CHECK(snap.embeddings[0].source_version == "v2");
  CHECK(snap.embeddings[1].item_id.value == "c");
}
