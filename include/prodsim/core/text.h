#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace prodsim::core {

// Locale-independent ASCII helpers. Output is byte-stable across platforms.

// Strips leading and trailing ASCII whitespace.
std::string_view trim_ascii(std::string_view input);

// Lowercases A-Z, splits on any non-alphanumeric byte, drops tokens shorter than
// min_length. Tokens are returned in encounter order.
std::vector<std::string> tokenize_ascii(std::string_view input, std::size_t min_length = 2);

}  // namespace prodsim::core
