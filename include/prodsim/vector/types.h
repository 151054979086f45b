#pragma once

#include <string>
#include <vector>

namespace prodsim::vector {

using Vector = std::vector<float>;

// A single ANN hit. distance is cosine distance in [0, 2].
struct Neighbor {
  std::string item_id;
  double distance;
};

}  // namespace prodsim::vector
