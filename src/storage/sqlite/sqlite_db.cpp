#include "prodsim/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace prodsim::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL (embeddings, alerts, audit log)
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS store_meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS embeddings (
  item_id TEXT NOT NULL,
  modality TEXT NOT NULL CHECK(modality IN ('text', 'image')),
  version INTEGER NOT NULL,
  dim INTEGER NOT NULL,
  vector_blob BLOB NOT NULL,
  created_at_ms INTEGER NOT NULL,
  source_version TEXT NOT NULL,
  is_current INTEGER NOT NULL CHECK(is_current IN (0, 1)),
  PRIMARY KEY (item_id, modality, version)
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_embeddings_current
  ON embeddings(item_id, modality) WHERE is_current = 1;

CREATE TABLE IF NOT EXISTS quality_alerts (
  item_id TEXT PRIMARY KEY,
  risk_level TEXT NOT NULL,
  severity INTEGER NOT NULL,
  rule_id TEXT NOT NULL,
  positive_reviews INTEGER NOT NULL,
  negative_reviews INTEGER NOT NULL,
  avg_rating REAL NOT NULL,
  review_count INTEGER NOT NULL,
  avg_sentiment REAL,
  explanation TEXT,
  generated_at_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_quality_alerts_severity
  ON quality_alerts(severity DESC, item_id);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

// Embedded schema v2 SQL (refresh run history)
constexpr const char* kSchemaV2 = R"(
CREATE TABLE IF NOT EXISTS refresh_runs (
  run_id TEXT PRIMARY KEY,
  started_at TEXT,
  completed_at TEXT,
  status TEXT NOT NULL,
  summary_json TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS refresh_failures (
  run_id TEXT NOT NULL,
  item_id TEXT NOT NULL,
  modality TEXT NOT NULL,
  attempts INTEGER NOT NULL,
  error_code TEXT NOT NULL,
  error_message TEXT NOT NULL,
  PRIMARY KEY (run_id, item_id, modality),
  FOREIGN KEY(run_id) REFERENCES refresh_runs(run_id) ON DELETE CASCADE
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (2, datetime('now'));
)";

// Embedded schema v3 SQL (local mirror of the external catalog and review aggregates)
constexpr const char* kSchemaV3 = R"(
CREATE TABLE IF NOT EXISTS catalog_items (
  item_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  category TEXT NOT NULL,
  price REAL NOT NULL,
  description TEXT NOT NULL,
  image_ref TEXT NOT NULL,
  last_modified_ms INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS reviews (
  review_idx INTEGER PRIMARY KEY AUTOINCREMENT,
  item_id TEXT NOT NULL,
  rating REAL NOT NULL,
  sentiment_raw TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_reviews_item ON reviews(item_id);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (3, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = sqlite3_errmsg(db);
    sqlite3_close(db);
    return R::err("Failed to open database: " + error);
  }

  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return R::err("Failed to enable foreign keys: " + error);
  }

  return R::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1";
  PreparedStatement stmt(db_.get(), sql);
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::apply_schema(const int version, const char* sql) {
  if (get_schema_version() >= version) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v" +
                                                std::to_string(version) + ": " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_schema(1, kSchemaV1);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v2() {
  auto v1_result = ensure_schema_v1();
  if (!v1_result.has_value()) {
    return v1_result;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_schema(2, kSchemaV2);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v3() {
  auto v2_result = ensure_schema_v2();
  if (!v2_result.has_value()) {
    return v2_result;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_schema(3, kSchemaV3);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

Transaction::Transaction(SqliteDb& db) : db_(db) {
  begun_ = db_.exec("BEGIN IMMEDIATE").has_value();
}

Transaction::~Transaction() {
  if (begun_ && !committed_) {
    // Nothing can be reported from a destructor; a failed rollback leaves the
    // transaction to be discarded when the connection closes.
    static_cast<void>(db_.exec("ROLLBACK"));
  }
}

core::Result<bool, std::string> Transaction::commit() {
  auto result = db_.exec("COMMIT");
  committed_ = result.has_value();
  return result;
}

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  if (raw == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(raw);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

}  // namespace prodsim::storage::sqlite
