#pragma once

#include "prodsim/core/clock.h"
#include "prodsim/core/id_generator.h"
#include "prodsim/core/services.h"
#include "prodsim/matching/recommendation_engine.h"

#include "config.h"
#include "refresh_worker.h"

namespace prodsim::server {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  core::Services& services;                      // NOLINT(readability-identifier-naming)
  const matching::RecommendationEngine& engine;  // NOLINT(readability-identifier-naming)
  RefreshWorker& refresher;                      // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;                    // NOLINT(readability-identifier-naming)
  core::IClock& clock;                           // NOLINT(readability-identifier-naming)
  const ServerConfig& config;                    // NOLINT(readability-identifier-naming)
};

}  // namespace prodsim::server
