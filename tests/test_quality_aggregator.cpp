#include "prodsim/core/clock.h"
#include "prodsim/quality/quality_aggregator.h"

#include <catch2/catch_test_macros.hpp>

using namespace prodsim;
using domain::RiskLevel;

namespace {

domain::Item item(const std::string& id) {
  domain::Item i;
  i.item_id = core::ItemId{id};
  i.name = "Item " + id;
  i.category = "garden";
  return i;
}

// Records the kinds of explanation requested.
class RecordingTextGenerator final : public adapters::ITextGenerator {
 public:
  core::Result<std::string, core::Error> explain(const adapters::ExplanationContext& context,
                                                 std::chrono::milliseconds /*timeout*/) override {
    subjects.push_back(context.subject_id);
    if (fail) {
      return core::Result<std::string, core::Error>::err(
          core::make_error(core::ErrorCode::kExternalServiceError, "offline"));
    }
    return core::Result<std::string, core::Error>::ok("explained " + context.subject_id);
  }

  std::vector<std::string> subjects;
  bool fail{false};
};

std::vector<domain::ReviewRecord> mixed_reviews() {
  std::vector<domain::ReviewRecord> reviews;
  // "bad": 1 positive, 4 negatives, avg 1.8 -> HIGH_RISK
  reviews.push_back({core::ItemId{"bad"}, 5.0, "0.9"});
  for (int i = 0; i < 4; ++i) {
    reviews.push_back({core::ItemId{"bad"}, 1.0, "0.1"});
  }
  // "meh": one negative, avg 3.5 -> MONITOR
  reviews.push_back({core::ItemId{"meh"}, 5.0, "0.8"});
  reviews.push_back({core::ItemId{"meh"}, 2.0, "0.2"});
  // "good": all positive -> OK
  reviews.push_back({core::ItemId{"good"}, 5.0, "0.95"});
  // not in the catalog
  reviews.push_back({core::ItemId{"ghost"}, 1.0, "0.0"});
  return reviews;
}

}  // namespace

TEST_CASE("one alert per catalog item, ordered by item_id", "[quality][aggregator]") {
  core::FixedClock clock(7000);
  quality::QualityAggregator aggregator({}, clock);

  const auto alerts = aggregator.generate_alerts(
      {item("meh"), item("good"), item("bad"), item("quiet")}, mixed_reviews());

  REQUIRE(alerts.size() == 4);
  CHECK(alerts[0].item_id.value == "bad");
  CHECK(alerts[0].risk_level == RiskLevel::kHighRisk);
  CHECK(alerts[0].evidence.negative_reviews == 4);
  CHECK(alerts[1].item_id.value == "good");
  CHECK(alerts[1].risk_level == RiskLevel::kOk);
  CHECK(alerts[2].item_id.value == "meh");
  CHECK(alerts[2].risk_level == RiskLevel::kMonitor);
  CHECK(alerts[3].item_id.value == "quiet");
  CHECK(alerts[3].risk_level == RiskLevel::kOk);
  CHECK(alerts[3].evidence.review_count == 0);
  CHECK(alerts[3].rule_id == "default-ok");

  for (const auto& alert : alerts) {
    CHECK(alert.item_id.value != "ghost");
    CHECK(core::to_unix_millis(alert.generated_at) == 7000);
    CHECK_FALSE(alert.explanation.has_value());
  }
}

TEST_CASE("explanations only for alerts at or above the configured level",
          "[quality][aggregator]") {
  core::FixedClock clock(7000);
  RecordingTextGenerator generator;

  quality::QualityConfig config;
  config.explain_at_or_above = RiskLevel::kMediumRisk;
  quality::QualityAggregator aggregator(config, clock, &generator);

  const auto alerts =
      aggregator.generate_alerts({item("bad"), item("good"), item("meh")}, mixed_reviews());

  REQUIRE(generator.subjects.size() == 1);
  CHECK(generator.subjects[0] == "bad");
  REQUIRE(alerts[0].explanation.has_value());
  CHECK(alerts[0].explanation.value() == "explained bad");
  CHECK_FALSE(alerts[2].explanation.has_value());
}

TEST_CASE("a failing generator leaves the alert without explanation", "[quality][aggregator]") {
  core::FixedClock clock(7000);
  RecordingTextGenerator generator;
  generator.fail = true;
  quality::QualityAggregator aggregator({}, clock, &generator);

  const auto alert = aggregator.build_alert(
      quality::aggregate_evidence(core::ItemId{"bad"}, mixed_reviews()), nullptr);
  CHECK(alert.risk_level == RiskLevel::kHighRisk);
  CHECK_FALSE(alert.explanation.has_value());
  CHECK(generator.subjects.size() == 1);
}

TEST_CASE("regenerating from the same reviews gives the same alerts", "[quality][aggregator]") {
  core::FixedClock clock(7000);
  quality::QualityAggregator aggregator({}, clock);
  const std::vector<domain::Item> items = {item("bad"), item("meh"), item("good")};

  const auto first = aggregator.generate_alerts(items, mixed_reviews());
  const auto second = aggregator.generate_alerts(items, mixed_reviews());
  REQUIRE(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    CHECK(first[i].risk_level == second[i].risk_level);
    CHECK(first[i].rule_id == second[i].rule_id);
  }
}
