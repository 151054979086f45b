#include "prodsim/storage/sqlite/sqlite_embedding_store.h"

#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace prodsim::storage::sqlite {

namespace {

using EmbeddingResult = core::Result<domain::Embedding, core::Error>;

constexpr const char* kSelectColumns =
    "SELECT item_id, modality, version, dim, vector_blob, created_at_ms, source_version,"
    "       is_current FROM embeddings";

std::runtime_error sqlite_failure(sqlite3* db, const std::string& what) {
  return std::runtime_error("embedding store: " + what + ": " + sqlite3_errmsg(db));
}

domain::Embedding read_row(sqlite3_stmt* stmt) {
  domain::Embedding e;
  e.item_id = core::ItemId{column_text(stmt, 0)};
  e.modality = domain::modality_from_string(column_text(stmt, 1)).value_or(domain::Modality::kText);
  e.version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
  e.dim = static_cast<std::size_t>(sqlite3_column_int64(stmt, 3));

  const auto* blob = sqlite3_column_blob(stmt, 4);
  const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 4));
  e.vector.resize(bytes / sizeof(float));
  if (blob != nullptr && bytes > 0) {
    std::memcpy(e.vector.data(), blob, e.vector.size() * sizeof(float));
  }

  e.created_at = core::from_unix_millis(sqlite3_column_int64(stmt, 5));
  e.source_version = column_text(stmt, 6);
  e.current = sqlite3_column_int(stmt, 7) != 0;
  return e;
}

std::optional<std::string> read_meta(sqlite3* db, const std::string& key) {
  PreparedStatement stmt(db, "SELECT value FROM store_meta WHERE key = ?");
  if (!stmt.is_valid()) {
    throw sqlite_failure(db, "prepare store_meta read");
  }
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return column_text(stmt.get(), 0);
  }
  return std::nullopt;
}

void write_meta(sqlite3* db, const std::string& key, const std::string& value) {
  PreparedStatement stmt(db, R"(
    INSERT INTO store_meta (key, value) VALUES (?, ?)
    ON CONFLICT(key) DO UPDATE SET value = excluded.value
  )");
  if (!stmt.is_valid()) {
    throw sqlite_failure(db, "prepare store_meta write");
  }
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw sqlite_failure(db, "write store_meta " + key);
  }
}

}  // namespace

SqliteEmbeddingStore::SqliteEmbeddingStore(std::shared_ptr<SqliteDb> db,
                                           EmbeddingStoreConfig config, core::IClock& clock)
    : db_(std::move(db)), config_(config), clock_(clock) {
  const auto error = validate_store_config(config_);
  if (!error.empty()) {
    throw std::invalid_argument(error);
  }
  std::lock_guard<std::mutex> lock(db_->mutex());
  check_recorded_dimensions();
}

void SqliteEmbeddingStore::check_recorded_dimensions() {
  sqlite3* conn = db_->connection();
  const std::pair<const char*, std::size_t> dims[] = {{"text_dim", config_.text_dim},
                                                      {"image_dim", config_.image_dim}};
  for (const auto& [key, configured] : dims) {
    const auto recorded = read_meta(conn, key);
    if (!recorded.has_value()) {
      write_meta(conn, key, std::to_string(configured));
      continue;
    }
    if (recorded.value() != std::to_string(configured)) {
      throw std::invalid_argument(std::string("conflicting dimension config: ") + key +
                                  " is " + recorded.value() + " in the database but " +
                                  std::to_string(configured) + " was configured");
    }
  }
}

std::uint64_t SqliteEmbeddingStore::read_generation() const {
  const auto value = read_meta(db_->connection(), "generation");
  return value.has_value() ? std::stoull(value.value()) : 0;
}

void SqliteEmbeddingStore::write_generation(const std::uint64_t generation) {
  write_meta(db_->connection(), "generation", std::to_string(generation));
}

domain::Embedding SqliteEmbeddingStore::write_row(const core::ItemId& item_id,
                                                  const domain::Modality modality,
                                                  const vector::Vector& vector,
                                                  const std::string& source_version) {
  sqlite3* conn = db_->connection();
  const std::string modality_str = domain::modality_to_string(modality);

  PreparedStatement retire(conn, R"(
    UPDATE embeddings SET is_current = 0
     WHERE item_id = ? AND modality = ? AND is_current = 1
  )");
  if (!retire.is_valid()) {
    throw sqlite_failure(conn, "prepare retire");
  }
  sqlite3_bind_text(retire.get(), 1, item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(retire.get(), 2, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(retire.get()) != SQLITE_DONE) {
    throw sqlite_failure(conn, "retire " + item_id.value);
  }

  domain::Embedding embedding;
  embedding.item_id = item_id;
  embedding.modality = modality;
  embedding.vector = vector;
  embedding.dim = vector.size();
  embedding.created_at = clock_.now();
  embedding.source_version = source_version;
  embedding.version = read_generation() + 1;
  embedding.current = true;

  PreparedStatement insert(conn, R"(
    INSERT INTO embeddings
      (item_id, modality, version, dim, vector_blob, created_at_ms, source_version, is_current)
    VALUES (?, ?, ?, ?, ?, ?, ?, 1)
  )");
  if (!insert.is_valid()) {
    throw sqlite_failure(conn, "prepare insert");
  }
  sqlite3_bind_text(insert.get(), 1, item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(insert.get(), 2, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(insert.get(), 3, static_cast<sqlite3_int64>(embedding.version));
  sqlite3_bind_int64(insert.get(), 4, static_cast<sqlite3_int64>(embedding.dim));
  sqlite3_bind_blob(insert.get(), 5, vector.data(), static_cast<int>(vector.size() * sizeof(float)),
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(insert.get(), 6, core::to_unix_millis(embedding.created_at));
  sqlite3_bind_text(insert.get(), 7, source_version.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(insert.get()) != SQLITE_DONE) {
    throw sqlite_failure(conn, "insert " + item_id.value);
  }

  // Keep only the newest retained_versions retired rows.
  PreparedStatement prune(conn, R"(
    DELETE FROM embeddings
     WHERE item_id = ?1 AND modality = ?2 AND is_current = 0
       AND version NOT IN (
         SELECT version FROM embeddings
          WHERE item_id = ?1 AND modality = ?2 AND is_current = 0
          ORDER BY version DESC LIMIT ?3)
  )");
  if (!prune.is_valid()) {
    throw sqlite_failure(conn, "prepare prune");
  }
  sqlite3_bind_text(prune.get(), 1, item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(prune.get(), 2, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(prune.get(), 3, static_cast<sqlite3_int64>(config_.retained_versions));
  if (sqlite3_step(prune.get()) != SQLITE_DONE) {
    throw sqlite_failure(conn, "prune " + item_id.value);
  }

  write_generation(embedding.version);
  return embedding;
}

EmbeddingResult SqliteEmbeddingStore::upsert(const core::ItemId& item_id,
                                             const domain::Modality modality,
                                             const vector::Vector& vector,
                                             const std::string& source_version) {
  const std::size_t expected = config_.dim_for(modality);
  if (vector.size() != expected) {
    return EmbeddingResult::err(dimension_mismatch(item_id, modality, expected, vector.size()));
  }

  std::lock_guard<std::mutex> lock(db_->mutex());
  Transaction tx(*db_);
  if (!tx.begun()) {
    throw sqlite_failure(db_->connection(), "begin upsert");
  }
  auto embedding = write_row(item_id, modality, vector, source_version);
  auto committed = tx.commit();
  if (!committed.has_value()) {
    throw std::runtime_error("embedding store: " + committed.error());
  }
  return EmbeddingResult::ok(std::move(embedding));
}

core::Result<bool, core::Error> SqliteEmbeddingStore::upsert_batch(
    const std::vector<EmbeddingWrite>& writes) {
  for (const auto& w : writes) {
    const std::size_t expected = config_.dim_for(w.modality);
    if (w.vector.size() != expected) {
      return core::Result<bool, core::Error>::err(
          dimension_mismatch(w.item_id, w.modality, expected, w.vector.size()));
    }
  }

  std::lock_guard<std::mutex> lock(db_->mutex());
  Transaction tx(*db_);
  if (!tx.begun()) {
    throw sqlite_failure(db_->connection(), "begin batch");
  }
  for (const auto& w : writes) {
    write_row(w.item_id, w.modality, w.vector, w.source_version);
  }
  auto committed = tx.commit();
  if (!committed.has_value()) {
    throw std::runtime_error("embedding store: " + committed.error());
  }
  return core::Result<bool, core::Error>::ok(true);
}

std::vector<domain::Embedding> SqliteEmbeddingStore::select_rows(const core::ItemId& item_id,
                                                                 const domain::Modality modality,
                                                                 const bool current) const {
  sqlite3* conn = db_->connection();
  const std::string sql = std::string(kSelectColumns) +
                          " WHERE item_id = ? AND modality = ? AND is_current = ?"
                          " ORDER BY version DESC";
  PreparedStatement stmt(conn, sql);
  if (!stmt.is_valid()) {
    throw sqlite_failure(conn, "prepare select");
  }
  const std::string modality_str = domain::modality_to_string(modality);
  sqlite3_bind_text(stmt.get(), 1, item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 3, current ? 1 : 0);

  std::vector<domain::Embedding> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(read_row(stmt.get()));
  }
  return rows;
}

EmbeddingResult SqliteEmbeddingStore::get(const core::ItemId& item_id,
                                          const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  auto rows = select_rows(item_id, modality, true);
  if (rows.empty()) {
    return EmbeddingResult::err(
        core::make_error(core::ErrorCode::kNotFound, "no " + domain::modality_to_string(modality) +
                                                         " embedding for " + item_id.value));
  }
  return EmbeddingResult::ok(std::move(rows.front()));
}

bool SqliteEmbeddingStore::is_stale(const core::ItemId& item_id, const domain::Modality modality,
                                    const core::Timestamp catalog_last_modified) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  const auto rows = select_rows(item_id, modality, true);
  if (rows.empty()) {
    return true;
  }
  // Stored timestamps have millisecond precision.
  return core::to_unix_millis(rows.front().created_at) < core::to_unix_millis(catalog_last_modified);
}

EmbeddingSnapshot SqliteEmbeddingStore::snapshot(const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  sqlite3* conn = db_->connection();

  EmbeddingSnapshot snap;
  snap.generation = read_generation();

  const std::string sql =
      std::string(kSelectColumns) + " WHERE modality = ? AND is_current = 1 ORDER BY item_id";
  PreparedStatement stmt(conn, sql);
  if (!stmt.is_valid()) {
    throw sqlite_failure(conn, "prepare snapshot");
  }
  const std::string modality_str = domain::modality_to_string(modality);
  sqlite3_bind_text(stmt.get(), 1, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    snap.embeddings.push_back(read_row(stmt.get()));
  }
  return snap;
}

std::vector<domain::Embedding> SqliteEmbeddingStore::history(
    const core::ItemId& item_id, const domain::Modality modality) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  return select_rows(item_id, modality, false);
}

EmbeddingResult SqliteEmbeddingStore::rollback(const core::ItemId& item_id,
                                               const domain::Modality modality) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  sqlite3* conn = db_->connection();

  const auto current = select_rows(item_id, modality, true);
  const auto retired = select_rows(item_id, modality, false);
  if (current.empty() || retired.empty()) {
    return EmbeddingResult::err(core::make_error(
        core::ErrorCode::kNotFound, "no retained version to roll back to for " + item_id.value));
  }

  Transaction tx(*db_);
  if (!tx.begun()) {
    throw sqlite_failure(conn, "begin rollback");
  }

  // Drop both the rolled-back-from row and the retired row being restored; the
  // restored vector is rewritten as a new current version.
  PreparedStatement drop(conn,
                         "DELETE FROM embeddings WHERE item_id = ? AND modality = ?"
                         " AND version IN (?, ?)");
  if (!drop.is_valid()) {
    throw sqlite_failure(conn, "prepare rollback delete");
  }
  const std::string modality_str = domain::modality_to_string(modality);
  sqlite3_bind_text(drop.get(), 1, item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(drop.get(), 2, modality_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(drop.get(), 3, static_cast<sqlite3_int64>(current.front().version));
  sqlite3_bind_int64(drop.get(), 4, static_cast<sqlite3_int64>(retired.front().version));
  if (sqlite3_step(drop.get()) != SQLITE_DONE) {
    throw sqlite_failure(conn, "rollback delete " + item_id.value);
  }

  auto restored =
      write_row(item_id, modality, retired.front().vector, retired.front().source_version);
  auto committed = tx.commit();
  if (!committed.has_value()) {
    throw std::runtime_error("embedding store: " + committed.error());
  }
  return EmbeddingResult::ok(std::move(restored));
}

std::uint64_t SqliteEmbeddingStore::generation() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  return read_generation();
}

}  // namespace prodsim::storage::sqlite
