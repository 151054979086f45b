#include "prodsim/vector/snapshot_registry.h"
#include "prodsim/vector/vector_index.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace prodsim;
using domain::Modality;

namespace {

vector::SnapshotPtr build_snapshot(const vector::VectorIndex& index, Modality modality,
                                   std::uint64_t version, std::size_t count) {
  std::vector<domain::Embedding> embeddings;
  for (std::size_t i = 0; i < count; ++i) {
    domain::Embedding e;
    e.item_id = core::ItemId{"item-" + std::to_string(i)};
    e.vector = {static_cast<float>(i + 1), 1.0f};
    e.dim = 2;
    embeddings.push_back(std::move(e));
  }
  auto built = index.build(2, embeddings,
                           vector::SnapshotStamp{modality, version, 0, core::from_unix_millis(0)});
  REQUIRE(built.has_value());
  return built.value();
}

vector::VectorIndex make_index() {
  vector::IvfOptions options;
  options.num_lists = 2;
  options.nprobe = 2;
  return vector::VectorIndex::create(options).value();
}

}  // namespace

TEST_CASE("registry starts empty and hands out monotonic versions", "[vector][snapshot]") {
  vector::SnapshotRegistry registry;
  CHECK(registry.current(Modality::kText) == nullptr);
  CHECK(registry.current(Modality::kImage) == nullptr);

  const auto v1 = registry.next_version();
  const auto v2 = registry.next_version();
  CHECK(v1 == 1);
  CHECK(v2 == 2);
}

TEST_CASE("a pinned snapshot survives a publish", "[vector][snapshot]") {
  const auto index = make_index();
  vector::SnapshotRegistry registry;
  registry.publish(build_snapshot(index, Modality::kText, 1, 3));

  const vector::SnapshotPtr pinned = registry.current(Modality::kText);
  REQUIRE(pinned != nullptr);

  registry.publish(build_snapshot(index, Modality::kText, 2, 5));

  CHECK(pinned->stamp().version == 1);
  CHECK(pinned->size() == 3);
  auto hits = index.query(*pinned, {1.0f, 1.0f}, 10);
  REQUIRE(hits.has_value());
  CHECK(hits.value().size() == 3);

  CHECK(registry.current(Modality::kText)->stamp().version == 2);
  CHECK(registry.current(Modality::kText)->size() == 5);
}

TEST_CASE("publishing several modalities is one step", "[vector][snapshot]") {
  const auto index = make_index();
  vector::SnapshotRegistry registry;

  registry.publish({{Modality::kText, build_snapshot(index, Modality::kText, 1, 2)},
                    {Modality::kImage, build_snapshot(index, Modality::kImage, 2, 4)}});

  REQUIRE(registry.current(Modality::kText) != nullptr);
  REQUIRE(registry.current(Modality::kImage) != nullptr);
  CHECK(registry.current(Modality::kText)->size() == 2);
  CHECK(registry.current(Modality::kImage)->size() == 4);
}

TEST_CASE("readers never observe a half-published snapshot", "[vector][snapshot][concurrency]") {
  const auto index = make_index();
  vector::SnapshotRegistry registry;
  registry.publish(build_snapshot(index, Modality::kText, 1, 4));

  std::vector<vector::SnapshotPtr> candidates;
  for (std::uint64_t v = 2; v <= 20; ++v) {
    candidates.push_back(build_snapshot(index, Modality::kText, v, 4 + v));
  }

  std::atomic<bool> done{false};
  std::atomic<int> inconsistent{0};
  std::thread reader([&]() {
    while (!done.load()) {
      const auto snap = registry.current(Modality::kText);
      // Every published snapshot of version v holds 4 + v items (v1 holds 4).
      const std::size_t expected = snap->stamp().version == 1 ? 4 : 4 + snap->stamp().version;
      if (snap->size() != expected) {
        ++inconsistent;
      }
    }
  });

  for (const auto& snap : candidates) {
    registry.publish(snap);
  }
  done.store(true);
  reader.join();

  CHECK(inconsistent.load() == 0);
  CHECK(registry.current(Modality::kText)->stamp().version == 20);
}
