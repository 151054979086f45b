#include "prodsim/core/text.h"

namespace prodsim::core {

namespace {

bool is_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

char lower(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch - 'A' + 'a');
  }
  return ch;
}

}  // namespace

std::string_view trim_ascii(std::string_view input) {
  while (!input.empty() && is_space(input.front())) {
    input.remove_prefix(1);
  }
  while (!input.empty() && is_space(input.back())) {
    input.remove_suffix(1);
  }
  return input;
}

std::vector<std::string> tokenize_ascii(const std::string_view input, const std::size_t min_length) {
  std::vector<std::string> tokens;
  std::string current;

  const auto flush = [&]() {
    if (!current.empty() && current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if (is_alnum(ch)) {
      current.push_back(lower(ch));
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

}  // namespace prodsim::core
