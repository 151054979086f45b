#pragma once

#include "prodsim/core/result.h"

#include <memory>
#include <mutex>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace prodsim::storage::sqlite {

// SqliteDb owns one SQLite connection and the schema migrations.
// Every store built on the same SqliteDb shares the connection; stores hold mutex()
// for the whole of each operation so multi-statement transactions never interleave.
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Current schema version (0 if no schema applied).
  [[nodiscard]] int get_schema_version() const;

  // v1: embeddings, store_meta, quality_alerts, audit_events.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();
  // v2: refresh_runs, refresh_failures. Applies v1 first.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v2();
  // v3: catalog_items, reviews. Applies v2 first.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v3();

  // Latest schema. Entry points call this once after open().
  [[nodiscard]] core::Result<bool, std::string> ensure_schema() { return ensure_schema_v3(); }

  // Execute SQL statement (for non-query operations).
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection, for store implementations only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  [[nodiscard]] std::mutex& mutex() const { return mutex_; }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  [[nodiscard]] core::Result<bool, std::string> apply_schema(int version, const char* sql);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  mutable std::mutex mutex_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// Scoped BEGIN IMMEDIATE / COMMIT. Rolls back unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  [[nodiscard]] bool begun() const { return begun_; }
  [[nodiscard]] core::Result<bool, std::string> commit();

 private:
  SqliteDb& db_;
  bool begun_{false};
  bool committed_{false};
};

// Column text as std::string; NULL reads as "".
std::string column_text(sqlite3_stmt* stmt, int col);

}  // namespace prodsim::storage::sqlite
