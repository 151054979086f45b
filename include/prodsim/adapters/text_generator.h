#pragma once

#include "prodsim/core/result.h"
#include "prodsim/domain/item.h"
#include "prodsim/domain/quality.h"

#include <chrono>
#include <string>

namespace prodsim::adapters {

enum class ExplanationKind { kRecommendation, kQualityAlert };

// Everything the text model is told about one explanation request.
// subject_id is the anchor (recommendations) or the flagged item (alerts);
// related_id is the candidate for recommendations and empty for alerts.
struct ExplanationContext {
  ExplanationKind kind{ExplanationKind::kRecommendation};
  std::string subject_id;
  std::string related_id;
  std::string prompt;
};

// ITextGenerator is the boundary to the external text-generation model.
// Explanations are best-effort decoration: callers drop the field on any failure.
// Callers stop waiting at `timeout` and leave an overrunning call to finish on its own
// thread, so a generator must outlive the calls made on it.
class ITextGenerator {
 public:
  virtual ~ITextGenerator() = default;

  [[nodiscard]] virtual core::Result<std::string, core::Error> explain(
      const ExplanationContext& context, std::chrono::milliseconds timeout) = 0;

 protected:
  ITextGenerator() = default;
  ITextGenerator(const ITextGenerator&) = default;
  ITextGenerator& operator=(const ITextGenerator&) = default;
  ITextGenerator(ITextGenerator&&) = default;
  ITextGenerator& operator=(ITextGenerator&&) = default;
};

// Prompt builders. Either item may be unknown to the catalog; the prompt then
// falls back to bare ids.
[[nodiscard]] ExplanationContext recommendation_context(const std::string& anchor_id,
                                                        const domain::Item* anchor,
                                                        const std::string& candidate_id,
                                                        const domain::Item* candidate,
                                                        double distance);
[[nodiscard]] ExplanationContext quality_alert_context(const domain::QualityAlert& alert,
                                                       const domain::Item* item);

// Offline generator that fills a fixed sentence from the context. Deterministic.
class TemplateTextGenerator final : public ITextGenerator {
 public:
  [[nodiscard]] core::Result<std::string, core::Error> explain(
      const ExplanationContext& context, std::chrono::milliseconds timeout) override;
};

}  // namespace prodsim::adapters
