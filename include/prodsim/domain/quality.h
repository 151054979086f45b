#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/core/time.h"

#include <optional>
#include <string>
#include <string_view>

namespace prodsim::domain {

// Ordered by severity: a larger enumerator is more severe.
enum class RiskLevel { kOk = 0, kMonitor = 1, kMediumRisk = 2, kHighRisk = 3 };

[[nodiscard]] std::string risk_level_to_string(RiskLevel level);
[[nodiscard]] std::optional<RiskLevel> risk_level_from_string(std::string_view s);

// Derived from raw reviews on every refresh. Never authoritative state.
struct QualityEvidence {
  core::ItemId item_id;
  int positive_reviews{0};
  int negative_reviews{0};
  double avg_rating{0.0};
  int review_count{0};
  std::optional<double> avg_sentiment;
};

struct QualityAlert {
  core::ItemId item_id;
  RiskLevel risk_level{RiskLevel::kOk};
  std::string rule_id;
  QualityEvidence evidence;
  std::optional<std::string> explanation;
  core::Timestamp generated_at{};
};

}  // namespace prodsim::domain
