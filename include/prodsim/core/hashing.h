#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace prodsim::core {

// FNV-1a 64-bit. Stable across platforms; not a cryptographic hash.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

// Hex fingerprint of the raw float bytes of a vector. Recorded in audit payloads
// so that two embeddings can be compared without dumping them.
std::string vector_fingerprint(const std::vector<float>& values);

}  // namespace prodsim::core
