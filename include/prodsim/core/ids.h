#pragma once

#include <compare>
#include <string>

namespace prodsim::core {

// Catalog item identifier. Immutable, owned by the external catalog.
struct ItemId {
  std::string value;
  auto operator<=>(const ItemId&) const = default;
};

}  // namespace prodsim::core
