#pragma once

#include "prodsim/indexing/refresh_run.h"
#include "prodsim/storage/sqlite/sqlite_db.h"

#include <memory>

namespace prodsim::storage::sqlite {

// refresh_runs + refresh_failures tables. Tests use a ":memory:" database.
class SqliteRefreshRunStore final : public indexing::IRefreshRunStore {
 public:
  explicit SqliteRefreshRunStore(std::shared_ptr<SqliteDb> db);

  void upsert_run(const indexing::RefreshRun& run) override;
  void record_failure(const indexing::RefreshFailure& failure) override;

  [[nodiscard]] std::optional<indexing::RefreshRun> get_run(
      const std::string& run_id) const override;
  [[nodiscard]] std::vector<indexing::RefreshRun> list_runs() const override;
  [[nodiscard]] std::vector<indexing::RefreshFailure> failures_for_run(
      const std::string& run_id) const override;
  [[nodiscard]] std::vector<indexing::RefreshFailure> failures_of_last_completed_run()
      const override;

 private:
  // Caller holds db_->mutex().
  [[nodiscard]] std::vector<indexing::RefreshFailure> select_failures(
      const std::string& run_id) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace prodsim::storage::sqlite
