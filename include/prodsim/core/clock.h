#pragma once

#include "prodsim/core/time.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace prodsim::core {

// Abstract clock interface for timestamp injection.
// Production code reads system time; tests drive a FixedClock forward explicitly.
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual Timestamp now() const = 0;

  [[nodiscard]] std::string now_iso8601() const { return format_iso8601(now()); }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  [[nodiscard]] Timestamp now() const override;
};

// Fixed clock: holds a settable instant. Safe to read from worker threads while a test advances it.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t unix_millis = 0) : millis_(unix_millis) {}

  [[nodiscard]] Timestamp now() const override;

  void set(std::int64_t unix_millis) { millis_.store(unix_millis); }
  void advance_millis(std::int64_t delta) { millis_.fetch_add(delta); }

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace prodsim::core
