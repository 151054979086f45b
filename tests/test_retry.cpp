#include "prodsim/adapters/retry.h"

#include <catch2/catch_test_macros.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace prodsim;
using namespace std::chrono_literals;

using IntResult = core::Result<int, core::Error>;

static adapters::RetryPolicy fast_policy(std::size_t attempts = 3) {
  adapters::RetryPolicy policy;
  policy.max_attempts = attempts;
  policy.initial_backoff = 1ms;
  policy.max_backoff = 4ms;
  policy.call_timeout = 1000ms;
  return policy;
}

static IntResult transient() {
  return IntResult::err(core::make_error(core::ErrorCode::kExternalServiceError, "503"));
}

namespace {

// Holds a call until released. Shared with the call so an abandoned call never
// touches test-owned state.
struct Gate {
  std::mutex mutex;
  std::condition_variable cv;
  bool open{false};

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      open = true;
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return open; });
  }
};

}  // namespace

TEST_CASE("backoff doubles up to the cap", "[adapters][retry]") {
  adapters::RetryPolicy policy;
  policy.initial_backoff = 100ms;
  policy.max_backoff = 350ms;
  CHECK(adapters::backoff_delay(policy, 1) == 100ms);
  CHECK(adapters::backoff_delay(policy, 2) == 200ms);
  CHECK(adapters::backoff_delay(policy, 3) == 350ms);
  CHECK(adapters::backoff_delay(policy, 10) == 350ms);
}

TEST_CASE("retry policy validation", "[adapters][retry]") {
  CHECK(adapters::validate_retry_policy(adapters::RetryPolicy{}).empty());

  auto policy = fast_policy();
  policy.max_attempts = 0;
  CHECK_FALSE(adapters::validate_retry_policy(policy).empty());

  policy = fast_policy();
  policy.call_timeout = 0ms;
  CHECK_FALSE(adapters::validate_retry_policy(policy).empty());

  policy = fast_policy();
  policy.initial_backoff = 10ms;
  policy.max_backoff = 5ms;
  CHECK_FALSE(adapters::validate_retry_policy(policy).empty());
}

TEST_CASE("transient failures are retried until success", "[adapters][retry]") {
  int calls = 0;
  std::size_t attempts = 0;
  auto result = adapters::call_with_retry<int>(
      fast_policy(), nullptr,
      [&](std::chrono::milliseconds) {
        ++calls;
        return calls < 3 ? transient() : IntResult::ok(42);
      },
      &attempts);

  REQUIRE(result.has_value());
  CHECK(result.value() == 42);
  CHECK(calls == 3);
  CHECK(attempts == 3);
}

TEST_CASE("retries stop at max_attempts", "[adapters][retry]") {
  int calls = 0;
  auto result = adapters::call_with_retry<int>(fast_policy(2), nullptr,
                                               [&](std::chrono::milliseconds) {
                                                 ++calls;
                                                 return transient();
                                               });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kExternalServiceError);
  CHECK(calls == 2);
}

TEST_CASE("non-transient errors are not retried", "[adapters][retry]") {
  int calls = 0;
  auto result = adapters::call_with_retry<int>(fast_policy(5), nullptr,
                                               [&](std::chrono::milliseconds) {
                                                 ++calls;
                                                 return IntResult::err(core::make_error(
                                                     core::ErrorCode::kDimensionMismatch, "bad"));
                                               });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kDimensionMismatch);
  CHECK(calls == 1);
}

TEST_CASE("exceptions become ExternalServiceError", "[adapters][retry]") {
  int calls = 0;
  auto result = adapters::call_with_retry<int>(
      fast_policy(2), nullptr, [&](std::chrono::milliseconds) -> IntResult {
        ++calls;
        throw std::runtime_error("connection reset");
      });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kExternalServiceError);
  CHECK(result.error().message == "connection reset");
  CHECK(calls == 2);
}

TEST_CASE("a late result is discarded", "[adapters][retry]") {
  auto result = adapters::guarded_call<int>(5ms, [](std::chrono::milliseconds) {
    std::this_thread::sleep_for(30ms);
    return IntResult::ok(1);
  });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kExternalServiceError);
}

TEST_CASE("a call that ignores its deadline is abandoned at the deadline", "[adapters][retry]") {
  auto gate = std::make_shared<Gate>();
  const auto started = std::chrono::steady_clock::now();
  auto result = adapters::guarded_call<int>(20ms, [gate](std::chrono::milliseconds) {
    gate->wait();
    return IntResult::ok(1);
  });
  const auto elapsed = std::chrono::steady_clock::now() - started;
  gate->release();

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kExternalServiceError);
  CHECK(elapsed >= 20ms);
  CHECK(elapsed < 2000ms);
}

TEST_CASE("the deadline is passed to the call", "[adapters][retry]") {
  std::chrono::milliseconds seen{0};
  auto policy = fast_policy();
  policy.call_timeout = 1234ms;
  auto result = adapters::call_with_retry<int>(policy, nullptr, [&](std::chrono::milliseconds t) {
    seen = t;
    return IntResult::ok(0);
  });
  CHECK(result.has_value());
  CHECK(seen == 1234ms);
}

TEST_CASE("cancellation stops retrying", "[adapters][retry]") {
  core::CancellationToken cancel;

  SECTION("before the first attempt") {
    cancel.request_cancel();
    int calls = 0;
    auto result = adapters::call_with_retry<int>(fast_policy(), &cancel,
                                                 [&](std::chrono::milliseconds) {
                                                   ++calls;
                                                   return IntResult::ok(1);
                                                 });
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kCancelled);
    CHECK(calls == 0);
  }

  SECTION("during backoff") {
    auto policy = fast_policy(5);
    policy.initial_backoff = 10000ms;
    policy.max_backoff = 10000ms;
    int calls = 0;
    const auto started = std::chrono::steady_clock::now();
    auto result = adapters::call_with_retry<int>(policy, &cancel, [&](std::chrono::milliseconds) {
      ++calls;
      cancel.request_cancel();
      return transient();
    });
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kCancelled);
    CHECK(calls == 1);
    CHECK(std::chrono::steady_clock::now() - started < 5000ms);
  }
}

TEST_CASE("cancellation interrupts a call that is still running", "[adapters][retry]") {
  core::CancellationToken cancel;
  auto gate = std::make_shared<Gate>();
  auto policy = fast_policy();
  policy.call_timeout = 10000ms;

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(20ms);
    cancel.request_cancel();
  });
  const auto started = std::chrono::steady_clock::now();
  auto result = adapters::call_with_retry<int>(policy, &cancel, [gate](std::chrono::milliseconds) {
    gate->wait();
    return IntResult::ok(1);
  });
  const auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();
  gate->release();

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kCancelled);
  CHECK(elapsed < 5000ms);
}
