#pragma once

#include "prodsim/adapters/text_generator.h"
#include "prodsim/core/clock.h"
#include "prodsim/core/ids.h"
#include "prodsim/core/result.h"
#include "prodsim/domain/recommendation.h"
#include "prodsim/storage/embedding_store.h"
#include "prodsim/storage/repositories.h"
#include "prodsim/vector/snapshot_registry.h"
#include "prodsim/vector/vector_index.h"

#include <chrono>
#include <optional>

namespace prodsim::matching {

struct RecommendationConfig {
  // Candidates farther than this cosine distance are dropped, possibly leaving fewer than k.
  std::optional<double> max_distance;
  bool attach_explanations{false};
  std::chrono::milliseconds explain_timeout{2000};
  // Results answered from a snapshot older than this carry an IndexStaleness warning.
  std::optional<std::chrono::milliseconds> staleness_threshold;
};

// Optional collaborators; any of them may be null.
struct RecommendationEnrichment {
  adapters::ITextGenerator* text_generator{nullptr};
  const storage::ICatalogRepository* catalog{nullptr};
};

// RecommendationEngine answers "similar items" queries. It never writes: each call pins
// the current snapshot once and answers entirely from it, so concurrent calls and a
// concurrent index rebuild never interfere.
class RecommendationEngine {
 public:
  RecommendationEngine(const storage::IEmbeddingStore& store,
                       const vector::SnapshotRegistry& registry, const vector::VectorIndex& index,
                       const core::IClock& clock, RecommendationConfig config = {},
                       RecommendationEnrichment enrichment = {});

  // Errors: InvalidConfig (k <= 0), NotFound (no current embedding for item_id).
  // An empty index or nothing under max_distance is an empty success.
  // Explanation failures only omit the field.
  [[nodiscard]] core::Result<domain::RecommendationResult, core::Error> get_recommendations(
      const core::ItemId& item_id, int k,
      domain::Modality modality = domain::Modality::kText) const;

  [[nodiscard]] const RecommendationConfig& config() const { return config_; }

 private:
  void attach_explanation(const core::ItemId& anchor, domain::Recommendation& rec) const;

  const storage::IEmbeddingStore& store_;
  const vector::SnapshotRegistry& registry_;
  const vector::VectorIndex& index_;
  const core::IClock& clock_;
  RecommendationConfig config_;
  RecommendationEnrichment enrichment_;
};

}  // namespace prodsim::matching
