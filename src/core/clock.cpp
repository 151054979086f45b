#include "prodsim/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace prodsim::core {

std::string format_iso8601(const Timestamp ts) {
  const auto time_t_value = Clock::to_time_t(ts);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

Timestamp SystemClock::now() const {
  return Clock::now();
}

Timestamp FixedClock::now() const {
  return from_unix_millis(millis_.load());
}

}  // namespace prodsim::core
