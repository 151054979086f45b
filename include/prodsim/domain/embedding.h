#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/core/time.h"
#include "prodsim/domain/item.h"
#include "prodsim/vector/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prodsim::domain {

enum class Modality { kText, kImage };

[[nodiscard]] std::string modality_to_string(Modality m);
[[nodiscard]] std::optional<Modality> modality_from_string(std::string_view s);

// One stored embedding version. version is the store-wide generation at which this
// row was written; it only ever increases.
struct Embedding {
  core::ItemId item_id;
  Modality modality{Modality::kText};
  vector::Vector vector;
  std::size_t dim{0};
  core::Timestamp created_at{};
  std::string source_version;
  std::uint64_t version{0};
  bool current{false};
};

// Input handed to the embedding provider for one (item, modality).
struct EmbeddingContent {
  std::string text;
  std::string image_ref;
};

// TEXT: "<name> <category> <description>".
// IMAGE: image_ref, or a descriptor of the product when the item has no image reference.
[[nodiscard]] EmbeddingContent make_embedding_content(const Item& item, Modality modality);

}  // namespace prodsim::domain
