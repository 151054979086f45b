#include "prodsim/adapters/embedding_provider.h"
#include "prodsim/core/hashing.h"
#include "prodsim/core/text.h"

#include <cmath>
#include <map>

namespace prodsim::adapters {

DeterministicStubEmbeddingProvider::DeterministicStubEmbeddingProvider(std::size_t text_dim,
                                                                       std::size_t image_dim)
    : text_dim_(text_dim), image_dim_(image_dim) {}

core::Result<vector::Vector, core::Error> DeterministicStubEmbeddingProvider::embed(
    const domain::EmbeddingContent& content, const domain::Modality modality,
    std::chrono::milliseconds /* timeout */) {
  const std::size_t dim = modality == domain::Modality::kText ? text_dim_ : image_dim_;
  if (dim == 0) {
    return core::Result<vector::Vector, core::Error>::err(core::make_error(
        core::ErrorCode::kExternalServiceError, "stub provider has no dimension configured"));
  }

  // Image refs are opaque: hash their path segments like words so that images
  // sharing a directory or name stem land close together.
  const std::string& source = content.image_ref.empty() ? content.text : content.image_ref;

  std::map<std::string, int> counts;
  for (const auto& token : core::tokenize_ascii(source)) {
    ++counts[token];
  }

  vector::Vector embedding(dim, 0.0f);
  for (const auto& [token, count] : counts) {
    const std::size_t idx = core::stable_hash64(token) % dim;
    const auto weight = static_cast<float>(count);
    embedding[idx] += weight;
    embedding[(idx + dim - 1) % dim] += weight * 0.3f;
    embedding[(idx + 1) % dim] += weight * 0.3f;
  }

  double norm = 0.0;
  for (const float v : embedding) {
    norm += static_cast<double>(v) * v;
  }
  if (norm > 0.0) {
    norm = std::sqrt(norm);
    for (float& v : embedding) {
      v = static_cast<float>(v / norm);
    }
  }
  return core::Result<vector::Vector, core::Error>::ok(std::move(embedding));
}

}  // namespace prodsim::adapters
