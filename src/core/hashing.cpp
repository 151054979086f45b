#include "prodsim/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace prodsim::core {

std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kPrime;
  }
  return hash;
}

std::string stable_hash64_hex(const std::string_view input) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << stable_hash64(input);
  return oss.str();
}

std::string vector_fingerprint(const std::vector<float>& values) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view bytes(reinterpret_cast<const char*>(values.data()),
                               values.size() * sizeof(float));
  return stable_hash64_hex(bytes);
}

}  // namespace prodsim::core
