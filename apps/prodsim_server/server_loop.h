#pragma once

#include "server_context.h"
#include <iosfwd>

namespace prodsim::server {

// Reads one JSON-RPC request per line from `in` and writes one response per line to
// `out` until end of input. Diagnostics go to std::cerr; `out` carries only JSON-RPC.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace prodsim::server
