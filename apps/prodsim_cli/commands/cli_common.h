#pragma once

#include "prodsim/core/result.h"

#include "shared/runtime.h"
#include "shared/runtime_config.h"
#include <memory>
#include <string>

// Prints "error: <code>: <message>" to stderr and returns the CLI failure exit code.
int report_error(const prodsim::core::Error& error);

// Validates the shared flags and opens the runtime; prints the reason and returns
// nullptr on failure.
std::unique_ptr<prodsim::apps::Runtime> open_runtime(const prodsim::apps::RuntimeConfig& config);
