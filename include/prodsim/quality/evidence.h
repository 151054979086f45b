#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/domain/item.h"
#include "prodsim/domain/quality.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prodsim::quality {

// Review polarity thresholds. A parsed sentiment score decides polarity; reviews
// without a usable score fall back to their star rating.
struct SentimentConfig {
  double positive_score_at_or_above{0.6};
  double negative_score_at_or_below{0.4};
  double positive_rating_at_or_above{4.0};
  double negative_rating_at_or_below{2.0};
};

// Accepts exactly the language ^\d*\.?\d+$ (after trimming ASCII whitespace):
// "0.85", ".5", "3" parse; "-0.2", "1.", "0.8 positive", "" do not.
[[nodiscard]] std::optional<double> parse_sentiment_score(std::string_view raw);

// Evidence for one item from its reviews. Reviews for other items are ignored.
[[nodiscard]] domain::QualityEvidence aggregate_evidence(
    const core::ItemId& item_id, const std::vector<domain::ReviewRecord>& reviews,
    const SentimentConfig& config = {});

// Evidence for every review-bearing item, keyed by item_id.
[[nodiscard]] std::map<std::string, domain::QualityEvidence> aggregate_all(
    const std::vector<domain::ReviewRecord>& reviews, const SentimentConfig& config = {});

}  // namespace prodsim::quality
