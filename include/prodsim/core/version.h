#pragma once

namespace prodsim::core {

inline constexpr const char* kVersion = "0.4.0";

}  // namespace prodsim::core
