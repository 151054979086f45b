#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <exception>
#include <iostream>
#include <string>

namespace prodsim::server {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Method registry
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(nullptr, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    std::cerr << "Received: " << request.method << "\n";

    if (request.method.empty()) {
      out << make_error_response(request.id, kInvalidRequest, "Missing method") << "\n"
          << std::flush;
      continue;
    }

    // Dispatch via method registry
    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      out << make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method)
          << "\n"
          << std::flush;
      continue;
    }

    try {
      const json result = it->second(request, ctx);
      out << make_response(request.id, result) << "\n" << std::flush;
    } catch (const RpcError& e) {
      out << make_error_response(request.id, e.code(), e.what()) << "\n" << std::flush;
    } catch (const std::exception& e) {
      std::cerr << "Internal error in " << request.method << ": " << e.what() << "\n";
      out << make_error_response(request.id, kInternalError, e.what()) << "\n" << std::flush;
    }
  }

  std::cerr << "prodsim_server shutting down\n";
}

}  // namespace prodsim::server
