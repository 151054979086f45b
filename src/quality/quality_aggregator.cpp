#include "prodsim/quality/quality_aggregator.h"

#include "prodsim/adapters/retry.h"

#include <algorithm>

namespace prodsim::quality {

QualityAggregator::QualityAggregator(QualityConfig config, core::IClock& clock,
                                     adapters::ITextGenerator* text_generator)
    : config_(config), clock_(clock), text_generator_(text_generator) {}

domain::QualityAlert QualityAggregator::build_alert(const domain::QualityEvidence& evidence,
                                                    const domain::Item* item) const {
  const Classification c = classify(evidence, config_.thresholds);

  domain::QualityAlert alert;
  alert.item_id = evidence.item_id;
  alert.risk_level = c.level;
  alert.rule_id = std::string(c.rule_id);
  alert.evidence = evidence;
  alert.generated_at = clock_.now();

  if (text_generator_ != nullptr && alert.risk_level >= config_.explain_at_or_above) {
    auto text = adapters::guarded_call<std::string>(
        config_.explain_timeout,
        [generator = text_generator_, context = adapters::quality_alert_context(alert, item)](
            std::chrono::milliseconds timeout) { return generator->explain(context, timeout); });
    if (text.has_value()) {
      alert.explanation = std::move(text.value());
    }
  }
  return alert;
}

std::vector<domain::QualityAlert> QualityAggregator::generate_alerts(
    const std::vector<domain::Item>& items,
    const std::vector<domain::ReviewRecord>& reviews) const {
  const auto evidence = aggregate_all(reviews, config_.sentiment);

  std::vector<domain::QualityAlert> alerts;
  alerts.reserve(items.size());
  for (const auto& item : items) {
    const auto it = evidence.find(item.item_id.value);
    if (it != evidence.end()) {
      alerts.push_back(build_alert(it->second, &item));
    } else {
      domain::QualityEvidence empty;
      empty.item_id = item.item_id;
      alerts.push_back(build_alert(empty, &item));
    }
  }

  std::sort(alerts.begin(), alerts.end(),
            [](const domain::QualityAlert& a, const domain::QualityAlert& b) {
              return a.item_id < b.item_id;
            });
  return alerts;
}

}  // namespace prodsim::quality
