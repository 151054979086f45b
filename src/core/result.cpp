#include "prodsim/core/result.h"

namespace prodsim::core {

std::string_view to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kDimensionMismatch:
      return "DimensionMismatch";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
    case ErrorCode::kExternalServiceError:
      return "ExternalServiceError";
    case ErrorCode::kIndexStaleness:
      return "IndexStaleness";
    case ErrorCode::kCancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace prodsim::core
