#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace prodsim::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

// UTC, second precision: "2026-01-31T12:00:00Z".
std::string format_iso8601(Timestamp ts);

}  // namespace prodsim::core
