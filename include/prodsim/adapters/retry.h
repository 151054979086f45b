#pragma once

#include "prodsim/core/cancellation.h"
#include "prodsim/core/result.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace prodsim::adapters {

// Per-item policy for external calls.
// Attempt n (1-based) that fails with ExternalServiceError is followed by a wait of
// min(initial_backoff * 2^(n-1), max_backoff) before attempt n+1.
struct RetryPolicy {
  std::size_t max_attempts{3};
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{5000};
  std::chrono::milliseconds call_timeout{10000};
};

// Returns empty string when valid, otherwise a human-readable reason.
[[nodiscard]] std::string validate_retry_policy(const RetryPolicy& policy);

[[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                                      std::size_t failed_attempt);

// One external call under a deadline. The call runs on its own detached thread and the
// caller waits at most `timeout` for it. A call that overruns is abandoned: its result is
// discarded whenever it arrives, and the caller gets ExternalServiceError at the deadline.
// Exceptions thrown by the call also become ExternalServiceError. When `cancel` is given,
// a cancellation request ends the wait early with kCancelled.
//
// `call` is moved onto the worker thread and may outlive this function, so it must own
// what it uses: capture by value, and only point at objects that outlive every call
// (the injected adapters).
template <typename T, typename Fn>
core::Result<T, core::Error> guarded_call(std::chrono::milliseconds timeout, Fn call,
                                          const core::CancellationToken* cancel = nullptr) {
  using R = core::Result<T, core::Error>;
  constexpr std::chrono::milliseconds kCancelPoll{10};

  auto promise = std::make_shared<std::promise<R>>();
  std::future<R> future = promise->get_future();
  try {
    std::thread([promise, call = std::move(call), timeout]() mutable {
      try {
        promise->set_value(call(timeout));
      } catch (const std::exception& e) {
        promise->set_value(
            R::err(core::make_error(core::ErrorCode::kExternalServiceError, e.what())));
      }
    }).detach();
  } catch (const std::system_error& e) {
    return R::err(core::make_error(core::ErrorCode::kExternalServiceError,
                                   std::string("could not start call: ") + e.what()));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                 std::chrono::milliseconds(1);
    if (cancel != nullptr) {
      slice = std::min(slice, kCancelPoll);
    }
    if (future.wait_for(slice) == std::future_status::ready) {
      return future.get();
    }
    if (cancel != nullptr && cancel->cancelled()) {
      return R::err(core::make_error(core::ErrorCode::kCancelled, "cancelled during call"));
    }
  }
  if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
    return future.get();
  }
  return R::err(core::make_error(core::ErrorCode::kExternalServiceError,
                                 "call exceeded " + std::to_string(timeout.count()) +
                                     "ms deadline"));
}

// guarded_call with bounded exponential backoff. Only ExternalServiceError is retried;
// any other error code is returned at once. A cancellation request is honoured before
// each attempt, during the call and during the backoff wait, yielding kCancelled.
// `call` is copied for every attempt.
// attempts_out, when given, receives the number of attempts made.
template <typename T, typename Fn>
core::Result<T, core::Error> call_with_retry(const RetryPolicy& policy,
                                             const core::CancellationToken* cancel, Fn&& call,
                                             std::size_t* attempts_out = nullptr) {
  using R = core::Result<T, core::Error>;
  const std::size_t max_attempts = std::max<std::size_t>(policy.max_attempts, 1);

  for (std::size_t attempt = 1;; ++attempt) {
    if (attempts_out != nullptr) {
      *attempts_out = attempt;
    }
    if (cancel != nullptr && cancel->cancelled()) {
      return R::err(core::make_error(core::ErrorCode::kCancelled, "cancelled before attempt " +
                                                                      std::to_string(attempt)));
    }

    R result = guarded_call<T>(policy.call_timeout, call, cancel);
    if (result.has_value() || result.error().code != core::ErrorCode::kExternalServiceError ||
        attempt >= max_attempts) {
      return result;
    }

    const auto delay = backoff_delay(policy, attempt);
    if (cancel != nullptr) {
      if (cancel->wait_for(delay)) {
        return R::err(
            core::make_error(core::ErrorCode::kCancelled, "cancelled during retry backoff"));
      }
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
}

}  // namespace prodsim::adapters
