#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/domain/quality.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prodsim::storage {

// Latest QualityAlert per item. Alerts are regenerated wholesale on each refresh:
// replace_all() swaps the entire set atomically, never patching individual rows.
class IAlertStore {
 public:
  virtual ~IAlertStore() = default;

  virtual void replace_all(const std::vector<domain::QualityAlert>& alerts) = 0;

  [[nodiscard]] virtual std::optional<domain::QualityAlert> get(const core::ItemId& id) const = 0;

  // Alerts at or above min_level, most severe first, then by item_id.
  [[nodiscard]] virtual std::vector<domain::QualityAlert> list(
      domain::RiskLevel min_level) const = 0;

 protected:
  IAlertStore() = default;
  IAlertStore(const IAlertStore&) = default;
  IAlertStore& operator=(const IAlertStore&) = default;
  IAlertStore(IAlertStore&&) = default;
  IAlertStore& operator=(IAlertStore&&) = default;
};

// Readers take a reference to the current immutable map; replace_all() swaps it.
class InMemoryAlertStore final : public IAlertStore {
 public:
  void replace_all(const std::vector<domain::QualityAlert>& alerts) override;
  [[nodiscard]] std::optional<domain::QualityAlert> get(const core::ItemId& id) const override;
  [[nodiscard]] std::vector<domain::QualityAlert> list(domain::RiskLevel min_level) const override;

 private:
  using AlertMap = std::map<std::string, domain::QualityAlert>;

  [[nodiscard]] std::shared_ptr<const AlertMap> current() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const AlertMap> alerts_ = std::make_shared<const AlertMap>();
};

// Shared ordering for list(): severity descending, then item_id ascending.
void sort_by_severity(std::vector<domain::QualityAlert>& alerts);

}  // namespace prodsim::storage
