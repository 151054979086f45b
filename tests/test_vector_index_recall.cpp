#include "prodsim/vector/vector_index.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <random>
#include <set>

using namespace prodsim;

// 2000 points in 32 Gaussian clusters on the unit sphere; IVF with 32 lists probing 12
// must agree with brute force on at least 95% of the top-10 neighbours.
TEST_CASE("IVF recall against exact search on clustered data", "[vector][index][recall]") {
  constexpr std::size_t kDim = 32;
  constexpr std::size_t kClusters = 32;
  constexpr std::size_t kPoints = 2000;
  constexpr std::size_t kQueries = 100;
  constexpr std::size_t kTopK = 10;
  constexpr double kSigma = 0.1;

  std::mt19937 rng(7);
  std::normal_distribution<float> gauss(0.0f, 1.0f);
  std::normal_distribution<float> noise(0.0f, static_cast<float>(kSigma));

  const auto normalized = [](vector::Vector v) {
    double norm = 0.0;
    for (const float x : v) {
      norm += static_cast<double>(x) * x;
    }
    norm = std::sqrt(norm);
    for (auto& x : v) {
      x = static_cast<float>(x / norm);
    }
    return v;
  };

  std::vector<vector::Vector> centers;
  for (std::size_t c = 0; c < kClusters; ++c) {
    vector::Vector v(kDim);
    for (auto& x : v) {
      x = gauss(rng);
    }
    centers.push_back(normalized(v));
  }

  const auto sample_near = [&](std::size_t c) {
    vector::Vector v = centers[c];
    for (auto& x : v) {
      x += noise(rng);
    }
    return v;
  };

  std::vector<domain::Embedding> embeddings;
  embeddings.reserve(kPoints);
  for (std::size_t i = 0; i < kPoints; ++i) {
    domain::Embedding e;
    e.item_id = core::ItemId{"p" + std::to_string(i)};
    e.vector = sample_near(i % kClusters);
    e.dim = kDim;
    embeddings.push_back(std::move(e));
  }

  vector::IvfOptions options;
  options.num_lists = 32;
  options.nprobe = 12;
  auto index = vector::VectorIndex::create(options);
  REQUIRE(index.has_value());

  const vector::SnapshotStamp stamp{domain::Modality::kText, 1, 0, core::from_unix_millis(0)};
  auto snapshot = index.value().build(kDim, embeddings, stamp);
  REQUIRE(snapshot.has_value());
  REQUIRE(snapshot.value()->size() == kPoints);

  std::size_t overlap = 0;
  for (std::size_t q = 0; q < kQueries; ++q) {
    const auto query = sample_near(q % kClusters);
    auto approx = index.value().query(*snapshot.value(), query, kTopK);
    auto exact = index.value().exact_query(*snapshot.value(), query, kTopK);
    REQUIRE(approx.has_value());
    REQUIRE(exact.has_value());
    REQUIRE(exact.value().size() == kTopK);

    std::set<std::string> truth;
    for (const auto& n : exact.value()) {
      truth.insert(n.item_id);
    }
    for (const auto& n : approx.value()) {
      overlap += truth.count(n.item_id);
    }
  }

  const double recall = static_cast<double>(overlap) / static_cast<double>(kQueries * kTopK);
  INFO("recall@10 = " << recall);
  CHECK(recall >= 0.95);
}
