#include "prodsim/storage/sqlite/sqlite_refresh_run_store.h"

#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace prodsim::storage::sqlite {

namespace {

constexpr const char* kRunColumns =
    "SELECT run_id, started_at, completed_at, status, summary_json FROM refresh_runs";

indexing::RefreshRun read_run(sqlite3_stmt* stmt) {
  indexing::RefreshRun run;
  run.run_id = column_text(stmt, 0);
  if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
    run.started_at = column_text(stmt, 1);
  }
  if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
    run.completed_at = column_text(stmt, 2);
  }
  run.status = indexing::refresh_run_status_from_string(column_text(stmt, 3));
  run.summary_json = column_text(stmt, 4);
  return run;
}

void bind_optional(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

}  // namespace

SqliteRefreshRunStore::SqliteRefreshRunStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteRefreshRunStore::upsert_run(const indexing::RefreshRun& run) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  const char* sql = R"(
    INSERT INTO refresh_runs (run_id, started_at, completed_at, status, summary_json)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT(run_id) DO UPDATE SET
      started_at   = excluded.started_at,
      completed_at = excluded.completed_at,
      status       = excluded.status,
      summary_json = excluded.summary_json
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("upsert_run: " + stmt.error());
  }
  const std::string status = indexing::refresh_run_status_to_string(run.status);
  sqlite3_bind_text(stmt.get(), 1, run.run_id.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional(stmt.get(), 2, run.started_at);
  bind_optional(stmt.get(), 3, run.completed_at);
  sqlite3_bind_text(stmt.get(), 4, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, run.summary_json.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("upsert_run: ") + sqlite3_errmsg(db_->connection()));
  }
}

void SqliteRefreshRunStore::record_failure(const indexing::RefreshFailure& failure) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  const char* sql = R"(
    INSERT INTO refresh_failures
      (run_id, item_id, modality, attempts, error_code, error_message)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(run_id, item_id, modality) DO UPDATE SET
      attempts      = excluded.attempts,
      error_code    = excluded.error_code,
      error_message = excluded.error_message
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("record_failure: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, failure.run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, failure.item_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, failure.modality.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(failure.attempts));
  sqlite3_bind_text(stmt.get(), 5, failure.error_code.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, failure.error_message.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("record_failure: ") + sqlite3_errmsg(db_->connection()));
  }
}

std::optional<indexing::RefreshRun> SqliteRefreshRunStore::get_run(
    const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string(kRunColumns) + " WHERE run_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_run(stmt.get());
  }
  return std::nullopt;
}

std::vector<indexing::RefreshRun> SqliteRefreshRunStore::list_runs() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string(kRunColumns) + " ORDER BY run_id ASC");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<indexing::RefreshRun> runs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    runs.push_back(read_run(stmt.get()));
  }
  return runs;
}

std::vector<indexing::RefreshFailure> SqliteRefreshRunStore::select_failures(
    const std::string& run_id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT run_id, item_id, modality, attempts, error_code, error_message"
                         "  FROM refresh_failures WHERE run_id = ? ORDER BY item_id, modality");
  if (!stmt.is_valid()) {
    return {};
  }
  sqlite3_bind_text(stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<indexing::RefreshFailure> failures;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    indexing::RefreshFailure f;
    f.run_id = column_text(stmt.get(), 0);
    f.item_id = column_text(stmt.get(), 1);
    f.modality = column_text(stmt.get(), 2);
    f.attempts = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 3));
    f.error_code = column_text(stmt.get(), 4);
    f.error_message = column_text(stmt.get(), 5);
    failures.push_back(std::move(f));
  }
  return failures;
}

std::vector<indexing::RefreshFailure> SqliteRefreshRunStore::failures_for_run(
    const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  return select_failures(run_id);
}

std::vector<indexing::RefreshFailure> SqliteRefreshRunStore::failures_of_last_completed_run()
    const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT run_id FROM refresh_runs WHERE status = 'completed'"
                         " ORDER BY run_id DESC LIMIT 1");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return {};
  }
  return select_failures(column_text(stmt.get(), 0));
}

}  // namespace prodsim::storage::sqlite
