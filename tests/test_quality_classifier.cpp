#include "prodsim/quality/classifier.h"

#include <catch2/catch_test_macros.hpp>

using namespace prodsim;
using domain::RiskLevel;

static domain::QualityEvidence evidence(int positive, int negative, double avg_rating) {
  domain::QualityEvidence e;
  e.item_id = core::ItemId{"sku-1"};
  e.positive_reviews = positive;
  e.negative_reviews = negative;
  e.avg_rating = avg_rating;
  e.review_count = positive + negative;
  return e;
}

TEST_CASE("decision list order", "[quality][classifier]") {
  const auto& rules = quality::quality_rules();
  REQUIRE(rules.size() == 3);
  CHECK(rules[0].level == RiskLevel::kHighRisk);
  CHECK(rules[1].level == RiskLevel::kMediumRisk);
  CHECK(rules[2].level == RiskLevel::kMonitor);
  CHECK(rules[0].rule_id == "negative-majority-low-rating");
  CHECK(rules[1].rule_id == "many-negatives-low-rating");
  CHECK(rules[2].rule_id == "negatives-below-monitor-rating");
}

TEST_CASE("negative majority with a low rating is HIGH_RISK", "[quality][classifier]") {
  const auto c = quality::classify(evidence(1, 4, 2.2));
  CHECK(c.level == RiskLevel::kHighRisk);
  CHECK(c.rule_id == "negative-majority-low-rating");
}

TEST_CASE("many negatives at exactly 3.0 stars is MEDIUM_RISK, not HIGH_RISK",
          "[quality][classifier]") {
  // 3.0 is not below the HIGH_RISK cut-off, so the second rule decides.
  const auto c = quality::classify(evidence(2, 6, 3.0));
  CHECK(c.level == RiskLevel::kMediumRisk);
  CHECK(c.rule_id == "many-negatives-low-rating");
}

TEST_CASE("first matching rule wins", "[quality][classifier]") {
  // Matches all three rules.
  CHECK(quality::classify(evidence(0, 8, 1.5)).level == RiskLevel::kHighRisk);
  // Matches MEDIUM and MONITOR.
  CHECK(quality::classify(evidence(10, 6, 3.4)).level == RiskLevel::kMediumRisk);
}

TEST_CASE("some negatives under four stars is MONITOR", "[quality][classifier]") {
  const auto c = quality::classify(evidence(5, 1, 3.9));
  CHECK(c.level == RiskLevel::kMonitor);
  CHECK(c.rule_id == "negatives-below-monitor-rating");
}

TEST_CASE("thresholds are strict inequalities", "[quality][classifier]") {
  // Exactly five negatives does not exceed 5.
  CHECK(quality::classify(evidence(10, 5, 3.0)).level == RiskLevel::kMonitor);
  // Exactly 4.0 is not below 4.0.
  CHECK(quality::classify(evidence(3, 1, 4.0)).level == RiskLevel::kOk);
  // Equal counts are not a negative majority.
  CHECK(quality::classify(evidence(2, 2, 1.0)).level == RiskLevel::kMonitor);
}

TEST_CASE("no negatives or no reviews is OK", "[quality][classifier]") {
  auto c = quality::classify(evidence(0, 0, 0.0));
  CHECK(c.level == RiskLevel::kOk);
  CHECK(c.rule_id == quality::kDefaultRuleId);
  CHECK(quality::classify(evidence(4, 0, 2.0)).level == RiskLevel::kOk);
}

TEST_CASE("thresholds are configurable", "[quality][classifier]") {
  quality::QualityThresholds strict;
  strict.monitor_rating_below = 4.5;
  CHECK(quality::classify(evidence(3, 1, 4.2), strict).level == RiskLevel::kMonitor);
  CHECK(quality::classify(evidence(3, 1, 4.2)).level == RiskLevel::kOk);
  CHECK(quality::classify(evidence(3, 1, 4.2), strict).rule_id ==
        "negatives-below-monitor-rating");
}

TEST_CASE("risk level strings", "[quality][classifier]") {
  CHECK(domain::risk_level_to_string(RiskLevel::kMediumRisk) == "MEDIUM_RISK");
  CHECK(domain::risk_level_from_string("HIGH_RISK") == RiskLevel::kHighRisk);
  CHECK(domain::risk_level_from_string("MONITOR") == RiskLevel::kMonitor);
  CHECK_FALSE(domain::risk_level_from_string("high").has_value());
  CHECK(RiskLevel::kHighRisk > RiskLevel::kMediumRisk);
}
