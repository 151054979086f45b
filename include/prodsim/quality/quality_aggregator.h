#pragma once

#include "prodsim/adapters/text_generator.h"
#include "prodsim/core/clock.h"
#include "prodsim/domain/item.h"
#include "prodsim/domain/quality.h"
#include "prodsim/quality/classifier.h"
#include "prodsim/quality/evidence.h"

#include <chrono>
#include <vector>

namespace prodsim::quality {

struct QualityConfig {
  QualityThresholds thresholds;
  SentimentConfig sentiment;
  // Explanations are requested only for alerts at or above this level.
  domain::RiskLevel explain_at_or_above{domain::RiskLevel::kMonitor};
  std::chrono::milliseconds explain_timeout{2000};
};

// QualityAggregator wraps classify() with evidence snapshotting and optional
// explanations. It keeps no state between calls: every refresh recomputes
// every alert from raw reviews.
class QualityAggregator {
 public:
  // text_generator may be null, in which case alerts never carry explanations.
  QualityAggregator(QualityConfig config, core::IClock& clock,
                    adapters::ITextGenerator* text_generator = nullptr);

  // item may be null when the catalog entry is unavailable; it only enriches the prompt.
  [[nodiscard]] domain::QualityAlert build_alert(const domain::QualityEvidence& evidence,
                                                 const domain::Item* item) const;

  // One alert per catalog item, ordered by item_id. Items without reviews are OK;
  // reviews of items missing from the catalog are ignored.
  [[nodiscard]] std::vector<domain::QualityAlert> generate_alerts(
      const std::vector<domain::Item>& items,
      const std::vector<domain::ReviewRecord>& reviews) const;

  [[nodiscard]] const QualityConfig& config() const { return config_; }

 private:
  QualityConfig config_;
  core::IClock& clock_;
  adapters::ITextGenerator* text_generator_;
};

}  // namespace prodsim::quality
