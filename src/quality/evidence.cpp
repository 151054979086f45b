#include "prodsim/quality/evidence.h"

#include "prodsim/core/text.h"

#include <exception>
#include <string>

namespace prodsim::quality {

namespace {

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

// Running sums for one item.
struct Tally {
  int positive{0};
  int negative{0};
  int count{0};
  double rating_sum{0.0};
  int scored{0};
  double score_sum{0.0};
};

void add_review(Tally& tally, const domain::ReviewRecord& review, const SentimentConfig& config) {
  ++tally.count;
  tally.rating_sum += review.rating;

  const auto score = parse_sentiment_score(review.sentiment_raw);
  if (score.has_value()) {
    ++tally.scored;
    tally.score_sum += score.value();
    if (score.value() >= config.positive_score_at_or_above) {
      ++tally.positive;
    } else if (score.value() <= config.negative_score_at_or_below) {
      ++tally.negative;
    }
    return;
  }

  if (review.rating >= config.positive_rating_at_or_above) {
    ++tally.positive;
  } else if (review.rating <= config.negative_rating_at_or_below) {
    ++tally.negative;
  }
}

domain::QualityEvidence to_evidence(const core::ItemId& item_id, const Tally& tally) {
  domain::QualityEvidence evidence;
  evidence.item_id = item_id;
  evidence.positive_reviews = tally.positive;
  evidence.negative_reviews = tally.negative;
  evidence.review_count = tally.count;
  evidence.avg_rating = tally.count > 0 ? tally.rating_sum / tally.count : 0.0;
  if (tally.scored > 0) {
    evidence.avg_sentiment = tally.score_sum / tally.scored;
  }
  return evidence;
}

}  // namespace

std::optional<double> parse_sentiment_score(std::string_view raw) {
  const std::string_view s = core::trim_ascii(raw);
  if (s.empty()) {
    return std::nullopt;
  }

  // \d* \.? \d+ : digits, at most one dot, and at least one digit after the dot.
  std::size_t dots = 0;
  for (const char ch : s) {
    if (ch == '.') {
      ++dots;
    } else if (!is_digit(ch)) {
      return std::nullopt;
    }
  }
  if (dots > 1 || !is_digit(s.back())) {
    return std::nullopt;
  }

  double value = 0.0;
  const std::string text(s);
  try {
    value = std::stod(text);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  return value;
}

domain::QualityEvidence aggregate_evidence(const core::ItemId& item_id,
                                           const std::vector<domain::ReviewRecord>& reviews,
                                           const SentimentConfig& config) {
  Tally tally;
  for (const auto& review : reviews) {
    if (review.item_id == item_id) {
      add_review(tally, review, config);
    }
  }
  return to_evidence(item_id, tally);
}

std::map<std::string, domain::QualityEvidence> aggregate_all(
    const std::vector<domain::ReviewRecord>& reviews, const SentimentConfig& config) {
  std::map<std::string, Tally> tallies;
  for (const auto& review : reviews) {
    add_review(tallies[review.item_id.value], review, config);
  }

  std::map<std::string, domain::QualityEvidence> out;
  for (const auto& [id, tally] : tallies) {
    out.emplace(id, to_evidence(core::ItemId{id}, tally));
  }
  return out;
}

}  // namespace prodsim::quality
