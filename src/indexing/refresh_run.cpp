#include "prodsim/indexing/refresh_run.h"

#include <stdexcept>

namespace prodsim::indexing {

std::string refresh_run_status_to_string(RefreshRunStatus s) {
  switch (s) {
    case RefreshRunStatus::kRunning:
      return "running";
    case RefreshRunStatus::kCompleted:
      return "completed";
    case RefreshRunStatus::kCancelled:
      return "cancelled";
    case RefreshRunStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

RefreshRunStatus refresh_run_status_from_string(const std::string& s) {
  if (s == "running")
    return RefreshRunStatus::kRunning;
  if (s == "completed")
    return RefreshRunStatus::kCompleted;
  if (s == "cancelled")
    return RefreshRunStatus::kCancelled;
  if (s == "failed")
    return RefreshRunStatus::kFailed;
  throw std::invalid_argument("Unknown RefreshRunStatus: " + s);
}

}  // namespace prodsim::indexing
