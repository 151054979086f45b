#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace prodsim::core {

// Cooperative cancellation flag shared between a refresh cycle and whoever started it.
// wait_for() doubles as an interruptible sleep for retry backoff.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;
  CancellationToken(CancellationToken&&) = delete;
  CancellationToken& operator=(CancellationToken&&) = delete;

  void request_cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Sleeps up to `duration`. Returns true if cancellation was requested meanwhile.
  bool wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_; });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_{false};
};

}  // namespace prodsim::core
