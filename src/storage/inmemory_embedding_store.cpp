#include "prodsim/storage/inmemory_embedding_store.h"

#include <stdexcept>

namespace prodsim::storage {

namespace {

using EmbeddingResult = core::Result<domain::Embedding, core::Error>;

core::Error not_found(const core::ItemId& item_id, const domain::Modality modality) {
  return core::make_error(core::ErrorCode::kNotFound, "no " + domain::modality_to_string(modality) +
                                                          " embedding for " + item_id.value);
}

}  // namespace

InMemoryEmbeddingStore::InMemoryEmbeddingStore(EmbeddingStoreConfig config, core::IClock& clock)
    : config_(config), clock_(clock) {
  const auto error = validate_store_config(config_);
  if (!error.empty()) {
    throw std::invalid_argument(error);
  }
}

domain::Embedding InMemoryEmbeddingStore::write_locked(const core::ItemId& item_id,
                                                       const domain::Modality modality,
                                                       const vector::Vector& vector,
                                                       const std::string& source_version) {
  Slot& slot = slots_[Key{item_id.value, modality}];
  if (slot.current.has_value()) {
    domain::Embedding retired = std::move(slot.current.value());
    retired.current = false;
    slot.retired.push_front(std::move(retired));
    while (slot.retired.size() > config_.retained_versions) {
      slot.retired.pop_back();
    }
  }

  domain::Embedding embedding;
  embedding.item_id = item_id;
  embedding.modality = modality;
  embedding.vector = vector;
  embedding.dim = vector.size();
  embedding.created_at = clock_.now();
  embedding.source_version = source_version;
  embedding.version = ++generation_;
  embedding.current = true;

  slot.current = embedding;
  return embedding;
}

EmbeddingResult InMemoryEmbeddingStore::upsert(const core::ItemId& item_id,
                                               const domain::Modality modality,
                                               const vector::Vector& vector,
                                               const std::string& source_version) {
  const std::size_t expected = config_.dim_for(modality);
  if (vector.size() != expected) {
    return EmbeddingResult::err(dimension_mismatch(item_id, modality, expected, vector.size()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return EmbeddingResult::ok(write_locked(item_id, modality, vector, source_version));
}

core::Result<bool, core::Error> InMemoryEmbeddingStore::upsert_batch(
    const std::vector<EmbeddingWrite>& writes) {
  for (const auto& w : writes) {
    const std::size_t expected = config_.dim_for(w.modality);
    if (w.vector.size() != expected) {
      return core::Result<bool, core::Error>::err(
          dimension_mismatch(w.item_id, w.modality, expected, w.vector.size()));
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& w : writes) {
    write_locked(w.item_id, w.modality, w.vector, w.source_version);
  }
  return core::Result<bool, core::Error>::ok(true);
}

EmbeddingResult InMemoryEmbeddingStore::get(const core::ItemId& item_id,
                                            const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(Key{item_id.value, modality});
  if (it == slots_.end() || !it->second.current.has_value()) {
    return EmbeddingResult::err(not_found(item_id, modality));
  }
  return EmbeddingResult::ok(it->second.current.value());
}

bool InMemoryEmbeddingStore::is_stale(const core::ItemId& item_id, const domain::Modality modality,
                                      const core::Timestamp catalog_last_modified) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(Key{item_id.value, modality});
  if (it == slots_.end() || !it->second.current.has_value()) {
    return true;
  }
  return it->second.current->created_at < catalog_last_modified;
}

EmbeddingSnapshot InMemoryEmbeddingStore::snapshot(const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EmbeddingSnapshot snap;
  snap.generation = generation_;
  // std::map order is (item_id, modality), so the output is ordered by item_id.
  for (const auto& [key, slot] : slots_) {
    if (key.second == modality && slot.current.has_value()) {
      snap.embeddings.push_back(slot.current.value());
    }
  }
  return snap;
}

std::vector<domain::Embedding> InMemoryEmbeddingStore::history(
    const core::ItemId& item_id, const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(Key{item_id.value, modality});
  if (it == slots_.end()) {
    return {};
  }
  return {it->second.retired.begin(), it->second.retired.end()};
}

EmbeddingResult InMemoryEmbeddingStore::rollback(const core::ItemId& item_id,
                                                 const domain::Modality modality) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(Key{item_id.value, modality});
  if (it == slots_.end() || !it->second.current.has_value() || it->second.retired.empty()) {
    return EmbeddingResult::err(core::make_error(
        core::ErrorCode::kNotFound, "no retained version to roll back to for " + item_id.value));
  }

  const domain::Embedding previous = it->second.retired.front();
  it->second.retired.pop_front();
  // The rolled-back-from version is dropped rather than retired, so repeated
  // rollbacks walk further back instead of toggling.
  it->second.current.reset();
  return EmbeddingResult::ok(
      write_locked(item_id, modality, previous.vector, previous.source_version));
}

std::uint64_t InMemoryEmbeddingStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

}  // namespace prodsim::storage
