#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace prodsim::indexing {

// Fixed-size pool of worker threads draining a FIFO queue.
// The destructor finishes every queued task, then joins. An exception thrown by a
// task is stored in that task's future.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  template <typename F, typename R = std::invoke_result_t<F&>>
  std::future<R> submit(F&& f) {
    // packaged_task is move-only; share it so the queue can hold a copyable std::function.
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    auto future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
  }

  [[nodiscard]] std::size_t size() const { return workers_.size(); }

 private:
  void run();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> queue_;
  std::vector<std::thread> workers_;
  bool done_{false};
};

}  // namespace prodsim::indexing
