#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace prodsim::server {

// JSON-RPC 2.0 request. id is kept as raw JSON (string, number or absent) so the
// response echoes it back unchanged.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  nlohmann::json id;           // NOLINT(readability-identifier-naming)
  std::string method;          // NOLINT(readability-identifier-naming)
  nlohmann::json params;       // NOLINT(readability-identifier-naming)
};

// Error codes (JSON-RPC 2.0)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Thrown by method and tool handlers; the server loop turns it into an error response.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] int code() const { return code_; }

 private:
  int code_;
};

// Parse JSON-RPC request from string. nullopt for malformed JSON or a non-object.
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const nlohmann::json& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::json& data = nlohmann::json::object());

}  // namespace prodsim::server
