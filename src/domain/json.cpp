#include "prodsim/domain/json.h"

namespace prodsim::domain {

nlohmann::json recommendation_result_to_json(const RecommendationResult& result) {
  nlohmann::json j;
  j["anchor"] = result.anchor.value;
  j["k"] = result.k;
  j["modality"] = modality_to_string(result.modality);
  j["snapshot_version"] = result.snapshot_version;

  nlohmann::json items = nlohmann::json::array();
  for (const auto& rec : result.items) {
    nlohmann::json item;
    item["item_id"] = rec.item_id.value;
    item["distance"] = rec.distance;
    item["rank"] = rec.rank;
    // Absent, not null, when no explanation was obtained.
    if (rec.explanation.has_value()) {
      item["explanation"] = rec.explanation.value();
    }
    items.push_back(item);
  }
  j["recommendations"] = items;

  if (!result.warnings.empty()) {
    j["warnings"] = result.warnings;
  }
  return j;
}

nlohmann::json quality_evidence_to_json(const QualityEvidence& evidence) {
  nlohmann::json j;
  j["item_id"] = evidence.item_id.value;
  j["positive_reviews"] = evidence.positive_reviews;
  j["negative_reviews"] = evidence.negative_reviews;
  j["avg_rating"] = evidence.avg_rating;
  j["review_count"] = evidence.review_count;
  if (evidence.avg_sentiment.has_value()) {
    j["avg_sentiment"] = evidence.avg_sentiment.value();
  }
  return j;
}

nlohmann::json quality_alert_to_json(const QualityAlert& alert) {
  nlohmann::json j;
  j["item_id"] = alert.item_id.value;
  j["risk_level"] = risk_level_to_string(alert.risk_level);
  j["rule_id"] = alert.rule_id;
  j["evidence"] = quality_evidence_to_json(alert.evidence);
  if (alert.explanation.has_value()) {
    j["explanation"] = alert.explanation.value();
  }
  j["generated_at"] = core::format_iso8601(alert.generated_at);
  j["generated_at_ms"] = core::to_unix_millis(alert.generated_at);
  return j;
}

QualityAlert quality_alert_from_json(const nlohmann::json& j) {
  QualityAlert alert;
  alert.item_id = core::ItemId{j.value("item_id", "")};
  alert.risk_level =
      risk_level_from_string(j.value("risk_level", "OK")).value_or(RiskLevel::kOk);
  alert.rule_id = j.value("rule_id", "");
  if (j.contains("explanation")) {
    alert.explanation = j["explanation"].get<std::string>();
  }
  alert.generated_at = core::from_unix_millis(j.value("generated_at_ms", std::int64_t{0}));

  if (j.contains("evidence")) {
    const auto& ev = j["evidence"];
    alert.evidence.item_id = alert.item_id;
    alert.evidence.positive_reviews = ev.value("positive_reviews", 0);
    alert.evidence.negative_reviews = ev.value("negative_reviews", 0);
    alert.evidence.avg_rating = ev.value("avg_rating", 0.0);
    alert.evidence.review_count = ev.value("review_count", 0);
    if (ev.contains("avg_sentiment")) {
      alert.evidence.avg_sentiment = ev["avg_sentiment"].get<double>();
    }
  }
  return alert;
}

core::Result<CatalogDocument, std::string> catalog_from_json(const nlohmann::json& j) {
  using R = core::Result<CatalogDocument, std::string>;

  if (!j.is_object()) {
    return R::err("catalog document must be a JSON object");
  }

  CatalogDocument doc;
  try {
    for (const auto& row : j.value("items", nlohmann::json::array())) {
      const std::string id = row.value("item_id", "");
      if (id.empty()) {
        return R::err("catalog item without item_id");
      }
      Item item;
      item.item_id = core::ItemId{id};
      item.name = row.value("name", "");
      item.category = row.value("category", "");
      item.price = row.value("price", 0.0);
      item.description = row.value("description", "");
      item.image_ref = row.value("image_ref", "");
      item.last_modified = core::from_unix_millis(row.value("last_modified_ms", std::int64_t{0}));
      doc.items.push_back(std::move(item));
    }

    for (const auto& row : j.value("reviews", nlohmann::json::array())) {
      const std::string id = row.value("item_id", "");
      if (id.empty()) {
        return R::err("review without item_id");
      }
      ReviewRecord review;
      review.item_id = core::ItemId{id};
      review.rating = row.value("rating", 0.0);
      // Upstream sometimes emits the score as a number, sometimes as free text.
      if (row.contains("sentiment")) {
        const auto& s = row["sentiment"];
        review.sentiment_raw = s.is_string() ? s.get<std::string>() : s.dump();
      }
      doc.reviews.push_back(std::move(review));
    }
  } catch (const nlohmann::json::exception& e) {
    return R::err(std::string("malformed catalog document: ") + e.what());
  }

  return R::ok(std::move(doc));
}

nlohmann::json error_to_json(const core::Error& error) {
  nlohmann::json j;
  j["error"] = {{"code", core::to_string(error.code)}, {"message", error.message}};
  return j;
}

}  // namespace prodsim::domain
