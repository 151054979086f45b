#include "prodsim/quality/evidence.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using namespace prodsim;

static domain::ReviewRecord review(const std::string& id, double rating, const std::string& raw) {
  return {core::ItemId{id}, rating, raw};
}

TEST_CASE("sentiment score grammar", "[quality][evidence]") {
  CHECK(quality::parse_sentiment_score("0.85").value() == Catch::Approx(0.85));
  CHECK(quality::parse_sentiment_score(".5").value() == Catch::Approx(0.5));
  CHECK(quality::parse_sentiment_score("3").value() == Catch::Approx(3.0));
  CHECK(quality::parse_sentiment_score("  0.2\t").value() == Catch::Approx(0.2));

  CHECK_FALSE(quality::parse_sentiment_score("").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("   ").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("-0.2").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("1.").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("0.8 positive").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("1.2.3").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("NaN").has_value());
  CHECK_FALSE(quality::parse_sentiment_score("1e3").has_value());
}

TEST_CASE("polarity comes from the score when it parses", "[quality][evidence]") {
  const std::vector<domain::ReviewRecord> reviews = {
      review("a", 1.0, "0.9"),   // positive despite one star
      review("a", 5.0, "0.1"),   // negative despite five stars
      review("a", 3.0, "0.5"),   // neutral
      review("a", 5.0, "0.6"),   // boundary: positive
      review("a", 1.0, "0.4"),   // boundary: negative
  };

  const auto e = quality::aggregate_evidence(core::ItemId{"a"}, reviews);
  CHECK(e.positive_reviews == 2);
  CHECK(e.negative_reviews == 2);
  CHECK(e.review_count == 5);
  CHECK(e.avg_rating == Catch::Approx(3.0));
  REQUIRE(e.avg_sentiment.has_value());
  CHECK(e.avg_sentiment.value() == Catch::Approx(0.5));
}

TEST_CASE("unparseable scores fall back to the star rating", "[quality][evidence]") {
  const std::vector<domain::ReviewRecord> reviews = {
      review("a", 5.0, "great"),
      review("a", 4.0, ""),
      review("a", 2.0, "-0.3"),
      review("a", 3.0, "meh"),
  };

  const auto e = quality::aggregate_evidence(core::ItemId{"a"}, reviews);
  CHECK(e.positive_reviews == 2);
  CHECK(e.negative_reviews == 1);
  CHECK(e.review_count == 4);
  CHECK_FALSE(e.avg_sentiment.has_value());
}

TEST_CASE("evidence ignores other items", "[quality][evidence]") {
  const std::vector<domain::ReviewRecord> reviews = {
      review("a", 5.0, "0.9"),
      review("b", 1.0, "0.1"),
  };

  const auto e = quality::aggregate_evidence(core::ItemId{"a"}, reviews);
  CHECK(e.review_count == 1);
  CHECK(e.negative_reviews == 0);

  const auto none = quality::aggregate_evidence(core::ItemId{"c"}, reviews);
  CHECK(none.review_count == 0);
  CHECK(none.avg_rating == Catch::Approx(0.0));
}

TEST_CASE("aggregate_all keys evidence by item", "[quality][evidence]") {
  const std::vector<domain::ReviewRecord> reviews = {
      review("b", 1.0, "0.1"),
      review("a", 5.0, "0.9"),
      review("b", 2.0, "bad"),
  };

  const auto all = quality::aggregate_all(reviews);
  REQUIRE(all.size() == 2);
  CHECK(all.at("a").positive_reviews == 1);
  CHECK(all.at("b").negative_reviews == 2);
  CHECK(all.at("b").avg_rating == Catch::Approx(1.5));
  CHECK(all.at("b").item_id.value == "b");
}
