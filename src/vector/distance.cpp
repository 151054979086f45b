#include "prodsim/vector/distance.h"

#include <cmath>

namespace prodsim::vector {

double dot(const float* a, const float* b, const std::size_t dim) {
  double sum = 0.0;
  for (std::size_t i = 0; i < dim; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

double l2_norm(const float* v, const std::size_t dim) {
  return std::sqrt(dot(v, v, dim));
}

double cosine_distance(const float* a, const double norm_a, const float* b, const double norm_b,
                       const std::size_t dim) {
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 1.0;
  }
  return 1.0 - dot(a, b, dim) / (norm_a * norm_b);
}

double cosine_distance(const Vector& a, const Vector& b) {
  if (a.size() != b.size() || a.empty()) {
    return 1.0;
  }
  return cosine_distance(a.data(), l2_norm(a.data(), a.size()), b.data(),
                         l2_norm(b.data(), b.size()), a.size());
}

bool neighbor_less(const Neighbor& a, const Neighbor& b) {
  if (a.distance != b.distance) {
    return a.distance < b.distance;
  }
  return a.item_id < b.item_id;
}

}  // namespace prodsim::vector
