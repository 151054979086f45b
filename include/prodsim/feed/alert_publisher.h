#pragma once

#include "prodsim/core/result.h"
#include "prodsim/domain/quality.h"

#include <mutex>
#include <string>
#include <vector>

namespace prodsim::feed {

// IAlertPublisher pushes each cycle's regenerated alerts to downstream consumers.
// A publish failure is reported to the caller; the alert store stays authoritative.
class IAlertPublisher {
 public:
  virtual ~IAlertPublisher() = default;

  [[nodiscard]] virtual core::Result<bool, core::Error> publish(
      const std::vector<domain::QualityAlert>& alerts, const std::string& run_id) = 0;

 protected:
  IAlertPublisher() = default;
  IAlertPublisher(const IAlertPublisher&) = default;
  IAlertPublisher& operator=(const IAlertPublisher&) = default;
  IAlertPublisher(IAlertPublisher&&) = default;
  IAlertPublisher& operator=(IAlertPublisher&&) = default;
};

// Records every batch; used by tests and by processes run without Redis.
class InMemoryAlertPublisher final : public IAlertPublisher {
 public:
  struct Batch {
    std::string run_id;
    std::vector<domain::QualityAlert> alerts;
  };

  [[nodiscard]] core::Result<bool, core::Error> publish(
      const std::vector<domain::QualityAlert>& alerts, const std::string& run_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.push_back({run_id, alerts});
    return core::Result<bool, core::Error>::ok(true);
  }

  [[nodiscard]] std::vector<Batch> batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Batch> batches_;
};

}  // namespace prodsim::feed
