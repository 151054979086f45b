#include "prodsim/storage/alert_store.h"

#include <algorithm>

namespace prodsim::storage {

void sort_by_severity(std::vector<domain::QualityAlert>& alerts) {
  std::sort(alerts.begin(), alerts.end(),
            [](const domain::QualityAlert& a, const domain::QualityAlert& b) {
              if (a.risk_level != b.risk_level) {
                return a.risk_level > b.risk_level;
              }
              return a.item_id < b.item_id;
            });
}

void InMemoryAlertStore::replace_all(const std::vector<domain::QualityAlert>& alerts) {
  auto next = std::make_shared<AlertMap>();
  for (const auto& alert : alerts) {
    (*next)[alert.item_id.value] = alert;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  alerts_ = std::move(next);
}

std::shared_ptr<const InMemoryAlertStore::AlertMap> InMemoryAlertStore::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alerts_;
}

std::optional<domain::QualityAlert> InMemoryAlertStore::get(const core::ItemId& id) const {
  const auto alerts = current();
  const auto it = alerts->find(id.value);
  if (it == alerts->end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::QualityAlert> InMemoryAlertStore::list(const domain::RiskLevel min_level) const {
  const auto alerts = current();
  std::vector<domain::QualityAlert> out;
  for (const auto& [_, alert] : *alerts) {
    if (alert.risk_level >= min_level) {
      out.push_back(alert);
    }
  }
  sort_by_severity(out);
  return out;
}

}  // namespace prodsim::storage
