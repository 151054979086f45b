#pragma once

#include "prodsim/adapters/embedding_provider.h"
#include "prodsim/adapters/text_generator.h"
#include "prodsim/feed/alert_publisher.h"
#include "prodsim/indexing/refresh_run.h"
#include "prodsim/storage/alert_store.h"
#include "prodsim/storage/audit_log.h"
#include "prodsim/storage/embedding_store.h"
#include "prodsim/storage/repositories.h"
#include "prodsim/vector/snapshot_registry.h"
#include "prodsim/vector/vector_index.h"

namespace prodsim::core {

// Services is a composition root that bundles all system dependencies.
// It holds references (not ownership) to stores, the index and the adapters.
// The CLI and the server create the concrete instances and manage their lifetimes.
//
// text_generator and alert_publisher are optional and may be null.
struct Services {
  storage::ICatalogRepository& catalog;               // NOLINT(readability-identifier-naming)
  storage::IReviewRepository& reviews;                // NOLINT(readability-identifier-naming)
  storage::IEmbeddingStore& embeddings;               // NOLINT(readability-identifier-naming)
  storage::IAlertStore& alerts;                       // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                      // NOLINT(readability-identifier-naming)
  indexing::IRefreshRunStore& runs;                   // NOLINT(readability-identifier-naming)
  const vector::VectorIndex& vector_index;            // NOLINT(readability-identifier-naming)
  vector::SnapshotRegistry& snapshots;                // NOLINT(readability-identifier-naming)
  adapters::IEmbeddingProvider& embedding_provider;   // NOLINT(readability-identifier-naming)
  adapters::ITextGenerator* text_generator{nullptr};  // NOLINT(readability-identifier-naming)
  feed::IAlertPublisher* alert_publisher{nullptr};    // NOLINT(readability-identifier-naming)

  Services(storage::ICatalogRepository& catalog, storage::IReviewRepository& reviews,
           storage::IEmbeddingStore& embeddings, storage::IAlertStore& alerts,
           storage::IAuditLog& audit_log, indexing::IRefreshRunStore& runs,
           const vector::VectorIndex& vector_index, vector::SnapshotRegistry& snapshots,
           adapters::IEmbeddingProvider& embedding_provider,
           adapters::ITextGenerator* text_generator = nullptr,
           feed::IAlertPublisher* alert_publisher = nullptr)
      : catalog(catalog),
        reviews(reviews),
        embeddings(embeddings),
        alerts(alerts),
        audit_log(audit_log),
        runs(runs),
        vector_index(vector_index),
        snapshots(snapshots),
        embedding_provider(embedding_provider),
        text_generator(text_generator),
        alert_publisher(alert_publisher) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace prodsim::core
