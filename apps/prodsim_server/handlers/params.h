#pragma once

#include <nlohmann/json.hpp>

#include "../mcp_protocol.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace prodsim::server::handlers {

// Typed access to tool arguments. A present value of the wrong type throws
// RpcError(kInvalidParams); a missing optional argument yields nullopt.

inline std::optional<std::string> optional_string(const nlohmann::json& params,
                                                  const std::string& key) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw RpcError(kInvalidParams, "'" + key + "' must be a string");
  }
  return it->get<std::string>();
}

inline std::string required_string(const nlohmann::json& params, const std::string& key) {
  auto value = optional_string(params, key);
  if (!value.has_value()) {
    throw RpcError(kInvalidParams, "missing required argument '" + key + "'");
  }
  return std::move(*value);
}

inline std::optional<int> optional_int(const nlohmann::json& params, const std::string& key) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw RpcError(kInvalidParams, "'" + key + "' must be an integer");
  }
  const bool in_range =
      it->is_number_unsigned()
          ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
          : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                it->get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    throw RpcError(kInvalidParams, "'" + key + "' is out of range");
  }
  return it->get<int>();
}

inline bool optional_bool(const nlohmann::json& params, const std::string& key, bool fallback) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw RpcError(kInvalidParams, "'" + key + "' must be a boolean");
  }
  return it->get<bool>();
}

}  // namespace prodsim::server::handlers
