#include "prodsim/core/id_generator.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace prodsim::core {

namespace {

std::string padded(unsigned long long value, int width) {
  std::ostringstream oss;
  oss << std::setw(width) << std::setfill('0') << value;
  return oss.str();
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = static_cast<unsigned long long>(
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + padded(micros, 17) + "-" + padded(c, 6);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  return std::string(prefix) + "-" + padded(c, 6);
}

}  // namespace prodsim::core
