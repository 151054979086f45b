#include "prodsim/domain/quality.h"

namespace prodsim::domain {

std::string risk_level_to_string(const RiskLevel level) {
  switch (level) {
    case RiskLevel::kOk:
      return "OK";
    case RiskLevel::kMonitor:
      return "MONITOR";
    case RiskLevel::kMediumRisk:
      return "MEDIUM_RISK";
    case RiskLevel::kHighRisk:
      return "HIGH_RISK";
  }
  return "UNKNOWN";
}

std::optional<RiskLevel> risk_level_from_string(const std::string_view s) {
  if (s == "OK")
    return RiskLevel::kOk;
  if (s == "MONITOR")
    return RiskLevel::kMonitor;
  if (s == "MEDIUM_RISK")
    return RiskLevel::kMediumRisk;
  if (s == "HIGH_RISK")
    return RiskLevel::kHighRisk;
  return std::nullopt;
}

}  // namespace prodsim::domain
