#include "prodsim/storage/embedding_store.h"

namespace prodsim::storage {

std::string validate_store_config(const EmbeddingStoreConfig& config) {
  if (config.text_dim == 0) {
    return "text embedding dimension must be > 0";
  }
  if (config.image_dim == 0) {
    return "image embedding dimension must be > 0";
  }
  return {};
}

core::Error dimension_mismatch(const core::ItemId& item_id, const domain::Modality modality,
                               const std::size_t expected, const std::size_t actual) {
  return core::make_error(core::ErrorCode::kDimensionMismatch,
                          "embedding for " + item_id.value + " (" +
                              domain::modality_to_string(modality) + ") has dimension " +
                              std::to_string(actual) + ", expected " + std::to_string(expected));
}

}  // namespace prodsim::storage
