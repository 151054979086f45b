#include "prodsim/adapters/retry.h"

namespace prodsim::adapters {

std::string validate_retry_policy(const RetryPolicy& policy) {
  if (policy.max_attempts == 0) {
    return "max_attempts must be >= 1";
  }
  if (policy.call_timeout.count() <= 0) {
    return "call_timeout must be > 0";
  }
  if (policy.initial_backoff.count() < 0 || policy.max_backoff < policy.initial_backoff) {
    return "backoff must satisfy 0 <= initial_backoff <= max_backoff";
  }
  return {};
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, const std::size_t failed_attempt) {
  auto delay = policy.initial_backoff;
  for (std::size_t i = 1; i < failed_attempt && delay < policy.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_backoff);
}

}  // namespace prodsim::adapters
