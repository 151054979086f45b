#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::indexing {

// kRunning: in progress (or the process died mid-cycle)
// kCompleted: every phase ran; individual items may still have failed
// kCancelled: stopped by request; see summary for how far it got
// kFailed: a storage or index error aborted the cycle
enum class RefreshRunStatus { kRunning, kCompleted, kCancelled, kFailed };

// One refresh cycle. summary_json carries the per-cycle metrics.
// Timestamps are optional so deterministic tests can omit them.
struct RefreshRun {
  std::string run_id;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  RefreshRunStatus status{RefreshRunStatus::kRunning};
  std::string summary_json{"{}"};
};

// An item that exhausted its retries in a run. The next run retries it first.
struct RefreshFailure {
  std::string run_id;
  std::string item_id;
  std::string modality;
  std::size_t attempts{0};
  std::string error_code;
  std::string error_message;
};

// refresh_run_status_from_string throws std::invalid_argument for unknown values.
std::string refresh_run_status_to_string(RefreshRunStatus s);
RefreshRunStatus refresh_run_status_from_string(const std::string& s);

// IRefreshRunStore persists RefreshRun and RefreshFailure records.
class IRefreshRunStore {
 public:
  virtual ~IRefreshRunStore() = default;

  virtual void upsert_run(const RefreshRun& run) = 0;
  virtual void record_failure(const RefreshFailure& failure) = 0;

  [[nodiscard]] virtual std::optional<RefreshRun> get_run(const std::string& run_id) const = 0;
  // Ordered by run_id ascending, which is creation order.
  [[nodiscard]] virtual std::vector<RefreshRun> list_runs() const = 0;
  // Ordered by (item_id, modality).
  [[nodiscard]] virtual std::vector<RefreshFailure> failures_for_run(
      const std::string& run_id) const = 0;
  // Failures of the newest kCompleted run; empty if there is none. Cancelled and
  // failed runs record no failures and are skipped.
  [[nodiscard]] virtual std::vector<RefreshFailure> failures_of_last_completed_run() const = 0;

 protected:
  IRefreshRunStore() = default;
  IRefreshRunStore(const IRefreshRunStore&) = default;
  IRefreshRunStore& operator=(const IRefreshRunStore&) = default;
  IRefreshRunStore(IRefreshRunStore&&) = default;
  IRefreshRunStore& operator=(IRefreshRunStore&&) = default;
};

}  // namespace prodsim::indexing
