#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace prodsim::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is rejected; it prints its own diagnostic.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool valid{true};                      // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Non-flag tokens are collected as positionals in order.
// Unknown flags, missing values and rejected values are reported to stderr and
// clear `valid`; parsing continues so every problem is reported at once.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.valid = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.valid = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.valid = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.valid = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// One line per flag: "  --name <value>  description".
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

// Strict numeric flag values: the whole token must parse.
inline std::optional<std::size_t> parse_size_value(const std::string& value) {
  if (value.empty() || value[0] == '-') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

inline std::optional<double> parse_double_value(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Generic handler body for a numeric flag.
template <typename T, typename Parse>
bool assign_number(T& target, const std::string& flag, const std::string& value, Parse parse) {
  const auto parsed = parse(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a number)\n";
    return false;
  }
  target = static_cast<T>(*parsed);
  return true;
}

}  // namespace prodsim::apps
