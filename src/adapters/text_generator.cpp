#include "prodsim/adapters/text_generator.h"

#include <iomanip>
#include <sstream>

namespace prodsim::adapters {

ExplanationContext recommendation_context(const std::string& anchor_id,
                                          const domain::Item* anchor,
                                          const std::string& candidate_id,
                                          const domain::Item* candidate, const double distance) {
  std::ostringstream prompt;
  prompt << "Explain why this product would be recommended to someone who bought ";
  if (anchor != nullptr) {
    prompt << anchor->name << " in the " << anchor->category << " category";
  } else {
    prompt << "item " << anchor_id;
  }
  prompt << ". Product: ";
  if (candidate != nullptr) {
    prompt << candidate->name << " (" << candidate->category << "), " << candidate->description;
  } else {
    prompt << "item " << candidate_id;
  }
  prompt << ". Similarity distance: " << std::fixed << std::setprecision(3) << distance << ".";

  return ExplanationContext{ExplanationKind::kRecommendation, anchor_id, candidate_id, prompt.str()};
}

ExplanationContext quality_alert_context(const domain::QualityAlert& alert,
                                         const domain::Item* item) {
  std::ostringstream prompt;
  prompt << "Summarize the quality concern for ";
  if (item != nullptr) {
    prompt << item->name << " in the " << item->category << " category";
  } else {
    prompt << "item " << alert.item_id.value;
  }
  prompt << ". Risk level " << domain::risk_level_to_string(alert.risk_level) << ": "
         << alert.evidence.negative_reviews << " negative and " << alert.evidence.positive_reviews
         << " positive reviews, average rating " << std::fixed << std::setprecision(2)
         << alert.evidence.avg_rating << ".";

  return ExplanationContext{ExplanationKind::kQualityAlert, alert.item_id.value, "", prompt.str()};
}

core::Result<std::string, core::Error> TemplateTextGenerator::explain(
    const ExplanationContext& context, std::chrono::milliseconds /* timeout */) {
  std::string text;
  if (context.kind == ExplanationKind::kRecommendation) {
    text = "Customers who bought " + context.subject_id + " often consider " + context.related_id +
           ": the two products are described in closely related terms.";
  } else {
    text = "Item " + context.subject_id +
           " is drawing more negative reviews than its rating can absorb; review recent "
           "feedback before promoting it.";
  }
  return core::Result<std::string, core::Error>::ok(std::move(text));
}

}  // namespace prodsim::adapters
