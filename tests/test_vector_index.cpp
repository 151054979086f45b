#include "prodsim/vector/distance.h"
#include "prodsim/vector/vector_index.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using namespace prodsim;

namespace {

domain::Embedding make_embedding(const std::string& id, vector::Vector v) {
  domain::Embedding e;
  e.item_id = core::ItemId{id};
  e.dim = v.size();
  e.vector = std::move(v);
  e.current = true;
  return e;
}

vector::VectorIndex make_index(std::size_t num_lists, std::size_t nprobe) {
  vector::IvfOptions options;
  options.num_lists = num_lists;
  options.nprobe = nprobe;
  auto index = vector::VectorIndex::create(options);
  REQUIRE(index.has_value());
  return index.value();
}

vector::SnapshotStamp stamp(std::uint64_t version) {
  return vector::SnapshotStamp{domain::Modality::kText, version, 0, core::from_unix_millis(0)};
}

std::vector<domain::Embedding> sample_embeddings() {
  return {
      make_embedding("a", {1.0f, 0.0f, 0.0f}),  make_embedding("b", {1.0f, 0.1f, 0.0f}),
      make_embedding("c", {0.0f, 1.0f, 0.0f}),  make_embedding("d", {1.0f, 0.0f, 0.5f}),
      make_embedding("e", {0.0f, 0.9f, 0.1f}),  make_embedding("f", {0.0f, 0.0f, 1.0f}),
  };
}

}  // namespace

TEST_CASE("cosine distance", "[vector][distance]") {
  CHECK(vector::cosine_distance({1.0f, 0.0f}, {1.0f, 0.0f}) == Catch::Approx(0.0));
  CHECK(vector::cosine_distance({1.0f, 0.0f}, {0.0f, 1.0f}) == Catch::Approx(1.0));
  CHECK(vector::cosine_distance({1.0f, 0.0f}, {-1.0f, 0.0f}) == Catch::Approx(2.0));
  CHECK(vector::cosine_distance({2.0f, 0.0f}, {5.0f, 0.0f}) == Catch::Approx(0.0));
  // Zero-magnitude operand.
  CHECK(vector::cosine_distance({0.0f, 0.0f}, {1.0f, 0.0f}) == Catch::Approx(1.0));
}

TEST_CASE("VectorIndex::create validates options", "[vector][index]") {
  vector::IvfOptions options;
  options.num_lists = 0;
  CHECK(vector::VectorIndex::create(options).error().code == core::ErrorCode::kInvalidConfig);
  options.num_lists = 4;
  options.nprobe = 0;
  CHECK(vector::VectorIndex::create(options).error().code == core::ErrorCode::kInvalidConfig);
  options.nprobe = 2;
  options.max_iterations = 0;
  CHECK(vector::VectorIndex::create(options).error().code == core::ErrorCode::kInvalidConfig);
}

TEST_CASE("empty snapshot is queryable", "[vector][index]") {
  const auto index = make_index(4, 2);
  auto snapshot = index.build(3, {}, stamp(1));
  REQUIRE(snapshot.has_value());
  CHECK(snapshot.value()->empty());

  auto hits = index.query(*snapshot.value(), {1.0f, 0.0f, 0.0f}, 5);
  REQUIRE(hits.has_value());
  CHECK(hits.value().empty());
}

TEST_CASE("build rejects vectors of the wrong dimension", "[vector][index]") {
  const auto index = make_index(2, 2);
  auto embeddings = sample_embeddings();
  embeddings.push_back(make_embedding("bad", {1.0f, 0.0f}));

  auto snapshot = index.build(3, embeddings, stamp(1));
  REQUIRE_FALSE(snapshot.has_value());
  CHECK(snapshot.error().code == core::ErrorCode::kDimensionMismatch);
}

TEST_CASE("num_lists is capped at the number of vectors", "[vector][index]") {
  const auto index = make_index(100, 8);
  auto snapshot = index.build(3, sample_embeddings(), stamp(1));
  REQUIRE(snapshot.has_value());
  CHECK(snapshot.value()->num_lists() == 6);
  CHECK(snapshot.value()->size() == 6);
}

TEST_CASE("query returns nearest first with id tie-break", "[vector][index]") {
  const auto index = make_index(2, 2);
  auto embeddings = sample_embeddings();
  embeddings.push_back(make_embedding("a2", {2.0f, 0.0f, 0.0f}));
  auto snapshot = index.build(3, embeddings, stamp(1));
  REQUIRE(snapshot.has_value());

  auto hits = index.query(*snapshot.value(), {1.0f, 0.0f, 0.0f}, 4);
  REQUIRE(hits.has_value());
  const auto& h = hits.value();
  REQUIRE(h.size() == 4);
  // "a" and "a2" are both at distance 0; id order decides.
  CHECK(h[0].item_id == "a");
  CHECK(h[1].item_id == "a2");
  CHECK(h[2].item_id == "b");
  CHECK(h[3].item_id == "d");
  CHECK(h[0].distance == Catch::Approx(0.0).margin(1e-6));
  CHECK(h[2].distance < h[3].distance);
}

TEST_CASE("query rejects a wrong-length query vector", "[vector][index]") {
  const auto index = make_index(2, 2);
  auto snapshot = index.build(3, sample_embeddings(), stamp(1));
  REQUIRE(snapshot.has_value());

  auto hits = index.query(*snapshot.value(), {1.0f, 0.0f}, 3);
  REQUIRE_FALSE(hits.has_value());
  CHECK(hits.error().code == core::ErrorCode::kDimensionMismatch);
}

TEST_CASE("build is deterministic for the same input and seed", "[vector][index]") {
  const auto index = make_index(3, 1);
  auto first = index.build(3, sample_embeddings(), stamp(1));
  auto second = index.build(3, sample_embeddings(), stamp(2));
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());

  for (const auto& e : sample_embeddings()) {
    CHECK(first.value()->list_of(e.item_id.value) == second.value()->list_of(e.item_id.value));
  }
  CHECK(first.value()->centroids() == second.value()->centroids());
}

TEST_CASE("insert produces a new snapshot and leaves the old one untouched", "[vector][index]") {
  const auto index = make_index(2, 2);
  auto base = index.build(3, sample_embeddings(), stamp(1));
  REQUIRE(base.has_value());
  const auto& old_snapshot = *base.value();

  auto extended = index.insert(old_snapshot, "g", {0.9f, 0.05f, 0.0f}, stamp(2));
  REQUIRE(extended.has_value());
  const auto& new_snapshot = *extended.value();

  CHECK(old_snapshot.size() == 6);
  CHECK_FALSE(old_snapshot.list_of("g").has_value());
  CHECK(new_snapshot.size() == 7);
  CHECK(new_snapshot.inserted_since_build() == 1);
  CHECK(new_snapshot.stamp().version == 2);

  // Lists the insert did not touch are shared.
  const std::size_t touched = new_snapshot.list_of("g").value();
  for (std::size_t i = 0; i < new_snapshot.num_lists(); ++i) {
    if (i != touched) {
      CHECK(new_snapshot.lists()[i] == old_snapshot.lists()[i]);
    } else {
      CHECK(new_snapshot.lists()[i] != old_snapshot.lists()[i]);
    }
  }

  auto hits = index.exact_query(new_snapshot, {1.0f, 0.05f, 0.0f}, 1);
  REQUIRE(hits.has_value());
  CHECK(hits.value().front().item_id == "g");
}

TEST_CASE("inserting an existing id moves it instead of duplicating", "[vector][index]") {
  const auto index = make_index(2, 2);
  auto base = index.build(3, sample_embeddings(), stamp(1));
  REQUIRE(base.has_value());

  auto moved = index.insert(*base.value(), "a", {0.0f, 0.0f, 1.0f}, stamp(2));
  REQUIRE(moved.has_value());
  CHECK(moved.value()->size() == 6);

  auto hits = index.exact_query(*moved.value(), {0.0f, 0.0f, 1.0f}, 2);
  REQUIRE(hits.has_value());
  CHECK(hits.value()[0].item_id == "a");
  CHECK(hits.value()[1].item_id == "f");
}

TEST_CASE("insert into an empty snapshot seeds a list", "[vector][index]") {
  const auto index = make_index(4, 2);
  auto empty = index.build(3, {}, stamp(1));
  REQUIRE(empty.has_value());

  auto batch = index.insert_batch(*empty.value(),
                                  {{"x", {1.0f, 0.0f, 0.0f}}, {"y", {0.0f, 1.0f, 0.0f}}}, stamp(2));
  REQUIRE(batch.has_value());
  CHECK(batch.value()->size() == 2);
  CHECK(batch.value()->num_lists() == 1);

  auto hits = index.query(*batch.value(), {0.0f, 1.0f, 0.0f}, 1);
  REQUIRE(hits.has_value());
  CHECK(hits.value().front().item_id == "y");
}
