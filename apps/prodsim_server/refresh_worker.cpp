#include "refresh_worker.h"

#include <exception>
#include <iostream>
#include <utility>

namespace prodsim::server {

RefreshWorker::RefreshWorker(indexing::RefreshPipeline& pipeline) : pipeline_(pipeline) {}

RefreshWorker::~RefreshWorker() {
  cancel();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool RefreshWorker::begin_locked() {
  if (running_) {
    return false;
  }
  running_ = true;
  cancel_ = std::make_unique<core::CancellationToken>();
  return true;
}

void RefreshWorker::complete(std::optional<indexing::RefreshResult> result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (result.has_value()) {
    last_ = std::move(result);
  }
  running_ = false;
}

bool RefreshWorker::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!begin_locked()) {
    return false;
  }
  // The previous background cycle has already marked itself finished.
  if (thread_.joinable()) {
    thread_.join();
  }

  const core::CancellationToken* token = cancel_.get();
  thread_ = std::thread([this, token]() {
    try {
      complete(pipeline_.run_cycle(*token));
    } catch (const std::exception& e) {
      std::cerr << "Background refresh aborted: " << e.what() << "\n";
      complete(std::nullopt);
    }
  });
  return true;
}

std::optional<indexing::RefreshResult> RefreshWorker::run_now() {
  const core::CancellationToken* token = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!begin_locked()) {
      return std::nullopt;
    }
    token = cancel_.get();
  }

  try {
    auto result = pipeline_.run_cycle(*token);
    complete(result);
    return result;
  } catch (const std::exception&) {
    complete(std::nullopt);
    throw;
  }
}

bool RefreshWorker::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_ || cancel_ == nullptr) {
    return false;
  }
  cancel_->request_cancel();
  return true;
}

bool RefreshWorker::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::optional<indexing::RefreshResult> RefreshWorker::last_result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_;
}

}  // namespace prodsim::server
