#include "prodsim/quality/classifier.h"

namespace prodsim::quality {

namespace {

bool negative_majority_low_rating(const domain::QualityEvidence& e, const QualityThresholds& t) {
  return e.negative_reviews > e.positive_reviews && e.avg_rating < t.high_risk_rating_below;
}

bool many_negatives(const domain::QualityEvidence& e, const QualityThresholds& t) {
  return e.negative_reviews > t.medium_risk_negatives_above &&
         e.avg_rating < t.medium_risk_rating_below;
}

bool negatives_below_monitor_rating(const domain::QualityEvidence& e, const QualityThresholds& t) {
  return e.avg_rating < t.monitor_rating_below && e.negative_reviews > 0;
}

constexpr std::array<QualityRule, 3> kRules{{
    {"negative-majority-low-rating", domain::RiskLevel::kHighRisk, &negative_majority_low_rating},
    {"many-negatives-low-rating", domain::RiskLevel::kMediumRisk, &many_negatives},
    {"negatives-below-monitor-rating", domain::RiskLevel::kMonitor,
     &negatives_below_monitor_rating},
}};

}  // namespace

const std::array<QualityRule, 3>& quality_rules() {
  return kRules;
}

Classification classify(const domain::QualityEvidence& evidence,
                        const QualityThresholds& thresholds) {
  for (const auto& rule : kRules) {
    if (rule.matches(evidence, thresholds)) {
      return Classification{rule.level, rule.rule_id};
    }
  }
  return Classification{domain::RiskLevel::kOk, kDefaultRuleId};
}

}  // namespace prodsim::quality
