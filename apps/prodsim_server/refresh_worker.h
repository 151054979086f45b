#pragma once

#include "prodsim/core/cancellation.h"
#include "prodsim/indexing/refresh_pipeline.h"

#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace prodsim::server {

// RefreshWorker runs refresh cycles for the server, at most one at a time, either on a
// dedicated background thread or on the caller's thread. Queries keep being served
// from the published snapshots while a cycle runs.
class RefreshWorker {
 public:
  explicit RefreshWorker(indexing::RefreshPipeline& pipeline);
  // Requests cancellation of a running cycle and joins the background thread.
  ~RefreshWorker();

  RefreshWorker(const RefreshWorker&) = delete;
  RefreshWorker& operator=(const RefreshWorker&) = delete;
  RefreshWorker(RefreshWorker&&) = delete;
  RefreshWorker& operator=(RefreshWorker&&) = delete;

  // Starts a background cycle. False when one is already running.
  bool start();

  // Runs a cycle on the calling thread. nullopt when one is already running.
  [[nodiscard]] std::optional<indexing::RefreshResult> run_now();

  // Returns true if a running cycle was asked to stop.
  bool cancel();

  [[nodiscard]] bool running() const;
  [[nodiscard]] std::optional<indexing::RefreshResult> last_result() const;

 private:
  // Caller holds mutex_. False when a cycle is already running.
  bool begin_locked();
  void complete(std::optional<indexing::RefreshResult> result);

  indexing::RefreshPipeline& pipeline_;
  mutable std::mutex mutex_;
  bool running_{false};
  std::unique_ptr<core::CancellationToken> cancel_;
  std::optional<indexing::RefreshResult> last_;
  std::thread thread_;
};

}  // namespace prodsim::server
