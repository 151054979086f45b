#pragma once

#include "prodsim/core/result.h"
#include "prodsim/domain/embedding.h"
#include "prodsim/vector/types.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace prodsim::adapters {

// IEmbeddingProvider is the boundary to the external embedding model.
// The core treats it as unreliable: it may fail (ExternalServiceError), throw, overrun
// the deadline, or return a vector of the wrong length. Callers check all of these.
//
// embed() is called concurrently from refresh workers.
//
// timeout is the caller's deadline for this one call. Implementations backed by a
// network client pass it through as their request timeout. The caller stops waiting at
// the deadline either way; a call still running then is abandoned on its own thread, so
// the provider must outlive it.
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  [[nodiscard]] virtual core::Result<vector::Vector, core::Error> embed(
      const domain::EmbeddingContent& content, domain::Modality modality,
      std::chrono::milliseconds timeout) = 0;

  // Identifies the model in run summaries and embedding source_version.
  [[nodiscard]] virtual std::string provider_id() const = 0;

 protected:
  IEmbeddingProvider() = default;
  IEmbeddingProvider(const IEmbeddingProvider&) = default;
  IEmbeddingProvider& operator=(const IEmbeddingProvider&) = default;
  IEmbeddingProvider(IEmbeddingProvider&&) = default;
  IEmbeddingProvider& operator=(IEmbeddingProvider&&) = default;
};

// DeterministicStubEmbeddingProvider generates stable vectors offline.
// Each token of the content is hashed (FNV-1a) to a slot, with 0.3 spilled onto
// both neighbouring slots, and the result is L2-normalized. Same content, same vector.
class DeterministicStubEmbeddingProvider final : public IEmbeddingProvider {
 public:
  DeterministicStubEmbeddingProvider(std::size_t text_dim, std::size_t image_dim);

  [[nodiscard]] core::Result<vector::Vector, core::Error> embed(
      const domain::EmbeddingContent& content, domain::Modality modality,
      std::chrono::milliseconds timeout) override;

  [[nodiscard]] std::string provider_id() const override { return "deterministic-stub"; }

 private:
  std::size_t text_dim_;
  std::size_t image_dim_;
};

}  // namespace prodsim::adapters
