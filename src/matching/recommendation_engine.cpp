#include "prodsim/matching/recommendation_engine.h"

#include "prodsim/adapters/retry.h"

#include <algorithm>

namespace prodsim::matching {

RecommendationEngine::RecommendationEngine(const storage::IEmbeddingStore& store,
                                           const vector::SnapshotRegistry& registry,
                                           const vector::VectorIndex& index,
                                           const core::IClock& clock, RecommendationConfig config,
                                           RecommendationEnrichment enrichment)
    : store_(store),
      registry_(registry),
      index_(index),
      clock_(clock),
      config_(config),
      enrichment_(enrichment) {}

core::Result<domain::RecommendationResult, core::Error> RecommendationEngine::get_recommendations(
    const core::ItemId& item_id, const int k, const domain::Modality modality) const {
  using R = core::Result<domain::RecommendationResult, core::Error>;

  if (k <= 0) {
    return R::err(core::make_error(core::ErrorCode::kInvalidConfig,
                                   "k must be > 0, got " + std::to_string(k)));
  }

  const auto anchor = store_.get(item_id, modality);
  if (!anchor.has_value()) {
    return R::err(anchor.error());
  }

  domain::RecommendationResult result;
  result.anchor = item_id;
  result.k = k;
  result.modality = modality;

  const vector::SnapshotPtr snapshot = registry_.current(modality);
  if (!snapshot) {
    return R::ok(std::move(result));
  }
  result.snapshot_version = snapshot->stamp().version;

  if (config_.staleness_threshold.has_value()) {
    const auto age = clock_.now() - snapshot->stamp().created_at;
    if (age > config_.staleness_threshold.value()) {
      result.warnings.push_back(
          std::string(core::to_string(core::ErrorCode::kIndexStaleness)) + ": snapshot v" +
          std::to_string(snapshot->stamp().version) + " is " +
          std::to_string(std::chrono::duration_cast<std::chrono::seconds>(age).count()) +
          "s old");
    }
  }

  // k + 1: the anchor usually finds itself at distance 0.
  auto hits = index_.query(*snapshot, anchor.value().vector, static_cast<std::size_t>(k) + 1);
  if (!hits.has_value()) {
    return R::err(hits.error());
  }

  int rank = 0;
  for (const auto& hit : hits.value()) {
    if (hit.item_id == item_id.value) {
      continue;
    }
    if (rank == k) {
      break;
    }
    // Hits are sorted by distance, so everything after the first miss also misses.
    if (config_.max_distance.has_value() && hit.distance > config_.max_distance.value()) {
      break;
    }
    domain::Recommendation rec;
    rec.item_id = core::ItemId{hit.item_id};
    rec.distance = hit.distance;
    rec.rank = ++rank;
    result.items.push_back(std::move(rec));
  }

  if (config_.attach_explanations && enrichment_.text_generator != nullptr) {
    for (auto& rec : result.items) {
      attach_explanation(item_id, rec);
    }
  }
  return R::ok(std::move(result));
}

void RecommendationEngine::attach_explanation(const core::ItemId& anchor,
                                              domain::Recommendation& rec) const {
  std::optional<domain::Item> anchor_item;
  std::optional<domain::Item> candidate_item;
  if (enrichment_.catalog != nullptr) {
    anchor_item = enrichment_.catalog->get(anchor);
    candidate_item = enrichment_.catalog->get(rec.item_id);
  }

  auto context = adapters::recommendation_context(
      anchor.value, anchor_item ? &anchor_item.value() : nullptr, rec.item_id.value,
      candidate_item ? &candidate_item.value() : nullptr, rec.distance);

  auto text = adapters::guarded_call<std::string>(
      config_.explain_timeout,
      [generator = enrichment_.text_generator, context = std::move(context)](
          std::chrono::milliseconds timeout) { return generator->explain(context, timeout); });
  if (text.has_value()) {
    rec.explanation = std::move(text.value());
  }
}

}  // namespace prodsim::matching
