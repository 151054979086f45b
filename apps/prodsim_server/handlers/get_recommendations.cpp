#include "get_recommendations.h"

#include "prodsim/app/app_service.h"
#include "prodsim/domain/json.h"

#include "params.h"
#include <string>

namespace prodsim::server::handlers {

using json = nlohmann::json;

json handle_get_recommendations(const json& params, ServerContext& ctx) {
  app::RecommendationRequest request;
  request.item_id = core::ItemId{required_string(params, "item_id")};
  if (const auto k = optional_int(params, "k"); k.has_value()) {
    request.k = *k;
  }
  if (const auto modality = optional_string(params, "modality"); modality.has_value()) {
    const auto parsed = domain::modality_from_string(*modality);
    if (!parsed.has_value()) {
      throw RpcError(kInvalidParams, "Invalid modality: " + *modality);
    }
    request.modality = *parsed;
  }
  request.trace_id = optional_string(params, "trace_id");

  const auto response =
      app::run_recommendation(request, ctx.engine, ctx.services, ctx.id_gen, ctx.clock);

  json result = response.result.has_value()
                    ? domain::recommendation_result_to_json(response.result.value())
                    : domain::error_to_json(response.result.error());
  result["trace_id"] = response.trace_id;
  return result;
}

}  // namespace prodsim::server::handlers
