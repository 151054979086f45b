#pragma once

#include "prodsim/core/result.h"
#include "prodsim/domain/item.h"
#include "prodsim/domain/quality.h"
#include "prodsim/domain/recommendation.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace prodsim::domain {

nlohmann::json recommendation_result_to_json(const RecommendationResult& result);
nlohmann::json quality_evidence_to_json(const QualityEvidence& evidence);
nlohmann::json quality_alert_to_json(const QualityAlert& alert);
QualityAlert quality_alert_from_json(const nlohmann::json& j);

// {"error": {"code": "<ErrorCode>", "message": ...}}
nlohmann::json error_to_json(const core::Error& error);

// Catalog import document:
//   {"items":   [{"item_id", "name", "category", "price", "description",
//                 "image_ref", "last_modified_ms"}],
//    "reviews": [{"item_id", "rating", "sentiment"}]}
// item_id is required on every row; everything else defaults.
struct CatalogDocument {
  std::vector<Item> items;
  std::vector<ReviewRecord> reviews;
};

core::Result<CatalogDocument, std::string> catalog_from_json(const nlohmann::json& j);

}  // namespace prodsim::domain
