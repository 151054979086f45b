#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/domain/embedding.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::domain {

struct Recommendation {
  core::ItemId item_id;
  double distance{0.0};
  int rank{0};  // 1-based
  std::optional<std::string> explanation;
};

// Invariants: anchor never appears in items; items.size() <= k;
// items sorted by (distance asc, item_id asc).
struct RecommendationResult {
  core::ItemId anchor;
  int k{0};
  Modality modality{Modality::kText};
  std::vector<Recommendation> items;
  std::uint64_t snapshot_version{0};
  std::vector<std::string> warnings;
};

}  // namespace prodsim::domain
