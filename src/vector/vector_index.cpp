#include "prodsim/vector/vector_index.h"

#include "prodsim/vector/distance.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>
#include <utility>

namespace prodsim::vector {

namespace {

using SnapshotResult = core::Result<SnapshotPtr, core::Error>;
using NeighborsResult = core::Result<std::vector<Neighbor>, core::Error>;

core::Error wrong_dimension(const std::string& what, std::size_t expected, std::size_t actual) {
  return core::make_error(core::ErrorCode::kDimensionMismatch,
                          what + " has dimension " + std::to_string(actual) +
                              ", index dimension is " + std::to_string(expected));
}

void normalize_into(const float* src, std::size_t dim, float* dst) {
  const double norm = l2_norm(src, dim);
  for (std::size_t d = 0; d < dim; ++d) {
    dst[d] = norm > 0.0 ? static_cast<float>(src[d] / norm) : 0.0f;
  }
}

// Index of the centroid with the highest dot product against a unit vector.
// Ties resolve to the lower index.
std::size_t nearest_centroid(const float* unit, const std::vector<float>& centroids,
                             std::size_t k, std::size_t dim) {
  std::size_t best = 0;
  double best_sim = -2.0;
  for (std::size_t c = 0; c < k; ++c) {
    const double sim = dot(unit, centroids.data() + c * dim, dim);
    if (sim > best_sim) {
      best_sim = sim;
      best = c;
    }
  }
  return best;
}

// Spherical k-means: centroids are kept unit length, so dot product is cosine similarity.
// Seeding is k-means++ over cosine distance with a fixed-seed generator, so the same
// input and seed always produce the same partition.
class SphericalKMeans {
 public:
  SphericalKMeans(const std::vector<float>& unit, std::size_t n, std::size_t dim, std::size_t k,
                  std::uint32_t seed)
      : unit_(unit), n_(n), dim_(dim), k_(k), rng_(seed), centroids_(k * dim, 0.0f) {}

  std::vector<float> train(std::size_t max_iterations) {
    seed_centroids();
    std::vector<std::size_t> assignment(n_, k_);
    for (std::size_t iter = 0; iter < max_iterations; ++iter) {
      const bool changed = assign(assignment);
      if (!changed && iter > 0) {
        break;
      }
      update(assignment);
    }
    return centroids_;
  }

 private:
  const float* point(std::size_t i) const { return unit_.data() + i * dim_; }
  float* centroid(std::size_t c) { return centroids_.data() + c * dim_; }

  void seed_centroids() {
    std::vector<bool> chosen(n_, false);
    std::vector<double> min_dist(n_, 0.0);

    std::uniform_int_distribution<std::size_t> pick(0, n_ - 1);
    std::size_t first = pick(rng_);
    chosen[first] = true;
    std::copy(point(first), point(first) + dim_, centroid(0));
    for (std::size_t i = 0; i < n_; ++i) {
      min_dist[i] = std::max(0.0, 1.0 - dot(point(i), centroid(0), dim_));
    }

    for (std::size_t c = 1; c < k_; ++c) {
      const double total = std::accumulate(min_dist.begin(), min_dist.end(), 0.0);
      std::size_t next = n_;
      if (total > 0.0) {
        std::uniform_real_distribution<double> draw(0.0, total);
        double target = draw(rng_);
        for (std::size_t i = 0; i < n_; ++i) {
          if (chosen[i]) {
            continue;
          }
          target -= min_dist[i];
          if (target <= 0.0) {
            next = i;
            break;
          }
        }
      }
      // All remaining points coincide with a centroid (or rounding ran past the end):
      // take the first unchosen point.
      if (next == n_) {
        for (std::size_t i = 0; i < n_; ++i) {
          if (!chosen[i]) {
            next = i;
            break;
          }
        }
      }
      chosen[next] = true;
      std::copy(point(next), point(next) + dim_, centroid(c));
      for (std::size_t i = 0; i < n_; ++i) {
        min_dist[i] = std::min(min_dist[i], std::max(0.0, 1.0 - dot(point(i), centroid(c), dim_)));
      }
    }
  }

  bool assign(std::vector<std::size_t>& assignment) const {
    bool changed = false;
    for (std::size_t i = 0; i < n_; ++i) {
      const std::size_t c = nearest_centroid(point(i), centroids_, k_, dim_);
      if (c != assignment[i]) {
        assignment[i] = c;
        changed = true;
      }
    }
    return changed;
  }

  void update(std::vector<std::size_t>& assignment) {
    std::vector<double> sums(k_ * dim_, 0.0);
    std::vector<std::size_t> counts(k_, 0);
    for (std::size_t i = 0; i < n_; ++i) {
      const std::size_t c = assignment[i];
      ++counts[c];
      for (std::size_t d = 0; d < dim_; ++d) {
        sums[c * dim_ + d] += point(i)[d];
      }
    }

    for (std::size_t c = 0; c < k_; ++c) {
      if (counts[c] == 0) {
        reseed_empty(c, assignment, counts);
        continue;
      }
      double norm = 0.0;
      for (std::size_t d = 0; d < dim_; ++d) {
        norm += sums[c * dim_ + d] * sums[c * dim_ + d];
      }
      norm = std::sqrt(norm);
      for (std::size_t d = 0; d < dim_; ++d) {
        centroid(c)[d] = norm > 0.0 ? static_cast<float>(sums[c * dim_ + d] / norm) : 0.0f;
      }
    }
  }

  // An empty cluster takes over the point worst served by its current centroid,
  // provided that point's cluster can spare it.
  void reseed_empty(std::size_t c, std::vector<std::size_t>& assignment,
                    std::vector<std::size_t>& counts) {
    std::size_t worst = n_;
    double worst_sim = 2.0;
    for (std::size_t i = 0; i < n_; ++i) {
      if (counts[assignment[i]] <= 1) {
        continue;
      }
      const double sim = dot(point(i), centroids_.data() + assignment[i] * dim_, dim_);
      if (sim < worst_sim) {
        worst_sim = sim;
        worst = i;
      }
    }
    if (worst == n_) {
      return;
    }
    --counts[assignment[worst]];
    assignment[worst] = c;
    counts[c] = 1;
    std::copy(point(worst), point(worst) + dim_, centroid(c));
  }

  const std::vector<float>& unit_;
  std::size_t n_;
  std::size_t dim_;
  std::size_t k_;
  std::mt19937 rng_;
  std::vector<float> centroids_;
};

std::vector<double> norms_of(const std::vector<float>& centroids, std::size_t k, std::size_t dim) {
  std::vector<double> norms(k, 0.0);
  for (std::size_t c = 0; c < k; ++c) {
    norms[c] = l2_norm(centroids.data() + c * dim, dim);
  }
  return norms;
}

}  // namespace

core::Result<VectorIndex, core::Error> VectorIndex::create(IvfOptions options) {
  using R = core::Result<VectorIndex, core::Error>;
  if (options.num_lists == 0) {
    return R::err(core::make_error(core::ErrorCode::kInvalidConfig, "num_lists must be > 0"));
  }
  if (options.nprobe == 0) {
    return R::err(core::make_error(core::ErrorCode::kInvalidConfig, "nprobe must be > 0"));
  }
  if (options.max_iterations == 0) {
    return R::err(core::make_error(core::ErrorCode::kInvalidConfig, "max_iterations must be > 0"));
  }
  if (options.max_training_points_per_list == 0) {
    return R::err(core::make_error(core::ErrorCode::kInvalidConfig,
                                   "max_training_points_per_list must be > 0"));
  }
  return R::ok(VectorIndex(options));
}

SnapshotResult VectorIndex::build(const std::size_t dimension,
                                  const std::vector<domain::Embedding>& embeddings,
                                  const SnapshotStamp& stamp) const {
  if (dimension == 0) {
    return SnapshotResult::err(
        core::make_error(core::ErrorCode::kInvalidConfig, "index dimension must be > 0"));
  }
  for (const auto& e : embeddings) {
    if (e.vector.size() != dimension) {
      return SnapshotResult::err(
          wrong_dimension("embedding " + e.item_id.value, dimension, e.vector.size()));
    }
  }

  const std::size_t n = embeddings.size();
  if (n == 0) {
    return SnapshotResult::ok(std::make_shared<const IndexSnapshot>(
        stamp, dimension, std::vector<float>{}, std::vector<double>{},
        std::vector<IndexSnapshot::ListPtr>{}, nullptr, 0));
  }

  const std::size_t k = std::min(options_.num_lists, n);

  std::vector<float> unit(n * dimension);
  for (std::size_t i = 0; i < n; ++i) {
    normalize_into(embeddings[i].vector.data(), dimension, unit.data() + i * dimension);
  }

  // Train on a deterministic sample when the corpus is large.
  const std::size_t max_training = k * options_.max_training_points_per_list;
  std::vector<float> training;
  std::size_t training_n = n;
  if (n > max_training) {
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(options_.seed);
    std::shuffle(order.begin(), order.end(), rng);
    training.resize(max_training * dimension);
    for (std::size_t s = 0; s < max_training; ++s) {
      std::copy(unit.begin() + static_cast<std::ptrdiff_t>(order[s] * dimension),
                unit.begin() + static_cast<std::ptrdiff_t>((order[s] + 1) * dimension),
                training.begin() + static_cast<std::ptrdiff_t>(s * dimension));
    }
    training_n = max_training;
  }

  SphericalKMeans kmeans(training.empty() ? unit : training, training_n, dimension, k,
                         options_.seed);
  std::vector<float> centroids = kmeans.train(options_.max_iterations);

  std::vector<std::shared_ptr<InvertedList>> building(k);
  for (auto& l : building) {
    l = std::make_shared<InvertedList>();
  }
  auto locator = std::make_shared<IndexSnapshot::Locator>();
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t c = nearest_centroid(unit.data() + i * dimension, centroids, k, dimension);
    InvertedList& list = *building[c];
    const auto& v = embeddings[i].vector;
    list.ids.push_back(embeddings[i].item_id.value);
    list.data.insert(list.data.end(), v.begin(), v.end());
    list.norms.push_back(l2_norm(v.data(), dimension));
    (*locator)[embeddings[i].item_id.value] = c;
  }

  std::vector<IndexSnapshot::ListPtr> lists(building.begin(), building.end());
  auto norms = norms_of(centroids, k, dimension);
  return SnapshotResult::ok(std::make_shared<const IndexSnapshot>(
      stamp, dimension, std::move(centroids), std::move(norms), std::move(lists),
      std::move(locator), 0));
}

std::vector<Neighbor> VectorIndex::scan(const IndexSnapshot& snapshot, const Vector& query,
                                        const std::vector<std::size_t>& lists,
                                        const std::size_t top_k) const {
  const std::size_t dim = snapshot.dimension();
  const double query_norm = l2_norm(query.data(), dim);

  std::vector<Neighbor> hits;
  for (const std::size_t li : lists) {
    const InvertedList& list = snapshot.list(li);
    for (std::size_t j = 0; j < list.size(); ++j) {
      const double d =
          cosine_distance(query.data(), query_norm, list.data.data() + j * dim, list.norms[j], dim);
      hits.push_back(Neighbor{list.ids[j], d});
    }
  }

  const std::size_t keep = std::min(top_k, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(keep), hits.end(),
                    neighbor_less);
  hits.resize(keep);
  return hits;
}

NeighborsResult VectorIndex::query(const IndexSnapshot& snapshot, const Vector& query,
                                   const std::size_t top_k) const {
  if (query.size() != snapshot.dimension()) {
    return NeighborsResult::err(wrong_dimension("query vector", snapshot.dimension(), query.size()));
  }
  if (snapshot.empty() || top_k == 0) {
    return NeighborsResult::ok({});
  }

  const std::size_t dim = snapshot.dimension();
  const double query_norm = l2_norm(query.data(), dim);

  // Rank centroids by distance to the query; lower list index wins ties.
  std::vector<std::pair<double, std::size_t>> ranked;
  ranked.reserve(snapshot.num_lists());
  for (std::size_t c = 0; c < snapshot.num_lists(); ++c) {
    ranked.emplace_back(
        cosine_distance(query.data(), query_norm, snapshot.centroid(c), snapshot.centroid_norm(c), dim),
        c);
  }
  const std::size_t probes = std::min(options_.nprobe, ranked.size());
  std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(probes),
                    ranked.end());

  std::vector<std::size_t> lists;
  lists.reserve(probes);
  for (std::size_t p = 0; p < probes; ++p) {
    lists.push_back(ranked[p].second);
  }
  return NeighborsResult::ok(scan(snapshot, query, lists, top_k));
}

NeighborsResult VectorIndex::exact_query(const IndexSnapshot& snapshot, const Vector& query,
                                         const std::size_t top_k) const {
  if (query.size() != snapshot.dimension()) {
    return NeighborsResult::err(wrong_dimension("query vector", snapshot.dimension(), query.size()));
  }
  std::vector<std::size_t> all(snapshot.num_lists());
  std::iota(all.begin(), all.end(), 0);
  return NeighborsResult::ok(scan(snapshot, query, all, top_k));
}

SnapshotResult VectorIndex::insert(const IndexSnapshot& snapshot, const std::string& item_id,
                                   const Vector& vector, const SnapshotStamp& stamp) const {
  return insert_batch(snapshot, {Insertion{item_id, vector}}, stamp);
}

SnapshotResult VectorIndex::insert_batch(const IndexSnapshot& snapshot,
                                         const std::vector<Insertion>& insertions,
                                         const SnapshotStamp& stamp) const {
  const std::size_t dim = snapshot.dimension();
  for (const auto& ins : insertions) {
    if (ins.vector.size() != dim) {
      return SnapshotResult::err(wrong_dimension("insert " + ins.item_id, dim, ins.vector.size()));
    }
  }

  std::vector<float> centroids = snapshot.centroids();
  std::vector<double> centroid_norms = snapshot.centroid_norms();
  std::vector<IndexSnapshot::ListPtr> lists = snapshot.lists();
  auto locator = std::make_shared<IndexSnapshot::Locator>(*snapshot.locator());

  // Lists copied so far; anything not in here is still shared with `snapshot`.
  std::map<std::size_t, std::shared_ptr<InvertedList>> copied;
  const auto mutable_list = [&](std::size_t li) -> InvertedList& {
    auto it = copied.find(li);
    if (it == copied.end()) {
      auto fresh = std::make_shared<InvertedList>(*lists[li]);
      lists[li] = fresh;
      it = copied.emplace(li, std::move(fresh)).first;
    }
    return *it->second;
  };

  std::vector<float> unit(dim);
  for (const auto& ins : insertions) {
    const auto existing = locator->find(ins.item_id);
    if (existing != locator->end()) {
      InvertedList& old_list = mutable_list(existing->second);
      const auto pos = static_cast<std::size_t>(
          std::find(old_list.ids.begin(), old_list.ids.end(), ins.item_id) - old_list.ids.begin());
      if (pos < old_list.size()) {
        old_list.ids.erase(old_list.ids.begin() + static_cast<std::ptrdiff_t>(pos));
        old_list.norms.erase(old_list.norms.begin() + static_cast<std::ptrdiff_t>(pos));
        old_list.data.erase(old_list.data.begin() + static_cast<std::ptrdiff_t>(pos * dim),
                            old_list.data.begin() + static_cast<std::ptrdiff_t>((pos + 1) * dim));
      }
    }

    normalize_into(ins.vector.data(), dim, unit.data());
    if (lists.empty()) {
      // First vector of an empty index seeds the only list.
      centroids.assign(unit.begin(), unit.end());
      centroid_norms.assign(1, l2_norm(unit.data(), dim));
      lists.push_back(std::make_shared<const InvertedList>());
    }
    const std::size_t c = nearest_centroid(unit.data(), centroids, lists.size(), dim);

    InvertedList& target = mutable_list(c);
    target.ids.push_back(ins.item_id);
    target.data.insert(target.data.end(), ins.vector.begin(), ins.vector.end());
    target.norms.push_back(l2_norm(ins.vector.data(), dim));
    (*locator)[ins.item_id] = c;
  }

  return SnapshotResult::ok(std::make_shared<const IndexSnapshot>(
      stamp, dim, std::move(centroids), std::move(centroid_norms), std::move(lists),
      std::move(locator), snapshot.inserted_since_build() + insertions.size()));
}

}  // namespace prodsim::vector
