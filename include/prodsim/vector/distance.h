#pragma once

#include "prodsim/vector/types.h"

#include <cstddef>

namespace prodsim::vector {

[[nodiscard]] double dot(const float* a, const float* b, std::size_t dim);
[[nodiscard]] double l2_norm(const float* v, std::size_t dim);

// 1 - cos(a, b). A zero-magnitude operand has similarity 0, hence distance 1.
[[nodiscard]] double cosine_distance(const float* a, double norm_a, const float* b, double norm_b,
                                     std::size_t dim);
[[nodiscard]] double cosine_distance(const Vector& a, const Vector& b);

// (distance asc, item_id asc). Exact comparison: identical inputs yield identical doubles.
[[nodiscard]] bool neighbor_less(const Neighbor& a, const Neighbor& b);

}  // namespace prodsim::vector
