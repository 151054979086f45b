#include "prodsim/storage/alert_store.h"
#include "prodsim/storage/sqlite/sqlite_alert_store.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <memory>

using namespace prodsim;
using domain::RiskLevel;

static domain::QualityAlert make_alert(const std::string& id, RiskLevel level,
                                       const std::string& rule_id = "rule") {
  domain::QualityAlert alert;
  alert.item_id = core::ItemId{id};
  alert.risk_level = level;
  alert.rule_id = rule_id;
  alert.evidence.item_id = alert.item_id;
  alert.evidence.positive_reviews = 2;
  alert.evidence.negative_reviews = 6;
  alert.evidence.avg_rating = 3.0;
  alert.evidence.review_count = 8;
  alert.generated_at = core::from_unix_millis(42000);
  return alert;
}

static std::unique_ptr<storage::IAlertStore> make_store(bool sqlite) {
  if (!sqlite) {
    return std::make_unique<storage::InMemoryAlertStore>();
  }
  auto db = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db.has_value());
  REQUIRE(db.value()->ensure_schema().has_value());
  return std::make_unique<storage::sqlite::SqliteAlertStore>(db.value());
}

TEST_CASE("alert stores order by severity then item_id", "[storage][alert-store]") {
  const bool sqlite = GENERATE(false, true);
  auto store = make_store(sqlite);

  store->replace_all({
      make_alert("d", RiskLevel::kOk),
      make_alert("c", RiskLevel::kHighRisk),
      make_alert("b", RiskLevel::kMediumRisk),
      make_alert("a", RiskLevel::kMediumRisk),
      make_alert("e", RiskLevel::kMonitor),
  });

  const auto medium_up = store->list(RiskLevel::kMediumRisk);
  REQUIRE(medium_up.size() == 3);
  CHECK(medium_up[0].item_id.value == "c");
  CHECK(medium_up[1].item_id.value == "a");
  CHECK(medium_up[2].item_id.value == "b");

  CHECK(store->list(RiskLevel::kOk).size() == 5);
  CHECK(store->list(RiskLevel::kHighRisk).size() == 1);
}

TEST_CASE("replace_all swaps the whole set", "[storage][alert-store]") {
  const bool sqlite = GENERATE(false, true);
  auto store = make_store(sqlite);

  store->replace_all({make_alert("a", RiskLevel::kHighRisk), make_alert("b", RiskLevel::kMonitor)});
  store->replace_all({make_alert("c", RiskLevel::kMonitor)});

  CHECK_FALSE(store->get(core::ItemId{"a"}).has_value());
  CHECK_FALSE(store->get(core::ItemId{"b"}).has_value());
  const auto c = store->get(core::ItemId{"c"});
  REQUIRE(c.has_value());
  CHECK(c->risk_level == RiskLevel::kMonitor);
  CHECK(c->evidence.negative_reviews == 6);
  CHECK(c->evidence.avg_rating == Catch::Approx(3.0));
  CHECK(core::to_unix_millis(c->generated_at) == 42000);

  store->replace_all({});
  CHECK(store->list(RiskLevel::kOk).empty());
}

TEST_CASE("SqliteAlertStore keeps explanations and optional sentiment",
          "[storage][sqlite][alert-store]") {
  auto store = make_store(true);

  auto alert = make_alert("a", RiskLevel::kHighRisk, "negative-majority-low-rating");
  alert.explanation = "Reviews trend negative.";
  alert.evidence.avg_sentiment = 0.25;
  store->replace_all({alert, make_alert("b", RiskLevel::kOk)});

  const auto a = store->get(core::ItemId{"a"});
  REQUIRE(a.has_value());
  CHECK(a->rule_id == "negative-majority-low-rating");
  REQUIRE(a->explanation.has_value());
  CHECK(a->explanation.value() == "Reviews trend negative.");
  REQUIRE(a->evidence.avg_sentiment.has_value());
  CHECK(a->evidence.avg_sentiment.value() == Catch::Approx(0.25));

  const auto b = store->get(core::ItemId{"b"});
  REQUIRE(b.has_value());
  CHECK_FALSE(b->explanation.has_value());
  CHECK_FALSE(b->evidence.avg_sentiment.has_value());
}
