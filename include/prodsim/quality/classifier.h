#pragma once

#include "prodsim/domain/quality.h"

#include <array>
#include <string_view>

namespace prodsim::quality {

// Decision-list thresholds. Defaults reproduce the production rule set.
struct QualityThresholds {
  double high_risk_rating_below{3.0};
  int medium_risk_negatives_above{5};
  double medium_risk_rating_below{3.5};
  double monitor_rating_below{4.0};
};

// One row of the ordered decision list.
struct QualityRule {
  std::string_view rule_id;
  domain::RiskLevel level;
  bool (*matches)(const domain::QualityEvidence&, const QualityThresholds&);
};

// The decision list, in evaluation order. The first matching rule wins, so a broader
// rule must never be moved ahead of a narrower one:
//   1. negatives > positives AND avg_rating < 3.0   -> HIGH_RISK
//   2. negatives > 5 AND avg_rating < 3.5           -> MEDIUM_RISK
//   3. avg_rating < 4.0 AND negatives > 0           -> MONITOR
// Evidence matching none of them is OK (rule "default-ok").
[[nodiscard]] const std::array<QualityRule, 3>& quality_rules();

inline constexpr std::string_view kDefaultRuleId = "default-ok";

struct Classification {
  domain::RiskLevel level;
  std::string_view rule_id;
};

// Total, deterministic and side-effect-free.
[[nodiscard]] Classification classify(const domain::QualityEvidence& evidence,
                                      const QualityThresholds& thresholds = {});

}  // namespace prodsim::quality
