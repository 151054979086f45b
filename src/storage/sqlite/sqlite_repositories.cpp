#include "prodsim/storage/sqlite/sqlite_repositories.h"

#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace prodsim::storage::sqlite {

namespace {

constexpr const char* kItemColumns =
    "SELECT item_id, name, category, price, description, image_ref, last_modified_ms"
    "  FROM catalog_items";

domain::Item read_item(sqlite3_stmt* stmt) {
  domain::Item item;
  item.item_id = core::ItemId{column_text(stmt, 0)};
  item.name = column_text(stmt, 1);
  item.category = column_text(stmt, 2);
  item.price = sqlite3_column_double(stmt, 3);
  item.description = column_text(stmt, 4);
  item.image_ref = column_text(stmt, 5);
  item.last_modified = core::from_unix_millis(sqlite3_column_int64(stmt, 6));
  return item;
}

}  // namespace

SqliteCatalogRepository::SqliteCatalogRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqliteCatalogRepository::upsert(const domain::Item& item) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  const char* sql = R"(
    INSERT INTO catalog_items
      (item_id, name, category, price, description, image_ref, last_modified_ms)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(item_id) DO UPDATE SET
      name             = excluded.name,
      category         = excluded.category,
      price            = excluded.price,
      description      = excluded.description,
      image_ref        = excluded.image_ref,
      last_modified_ms = excluded.last_modified_ms
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("catalog upsert: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, item.item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, item.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, item.category.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt.get(), 4, item.price);
  sqlite3_bind_text(stmt.get(), 5, item.description.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, item.image_ref.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 7, core::to_unix_millis(item.last_modified));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("catalog upsert: ") +
                             sqlite3_errmsg(db_->connection()));
  }
}

std::optional<domain::Item> SqliteCatalogRepository::get(const core::ItemId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string(kItemColumns) + " WHERE item_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_item(stmt.get());
  }
  return std::nullopt;
}

std::vector<domain::Item> SqliteCatalogRepository::list_all() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string(kItemColumns) + " ORDER BY item_id");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<domain::Item> items;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    items.push_back(read_item(stmt.get()));
  }
  return items;
}

SqliteReviewRepository::SqliteReviewRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqliteReviewRepository::append(const domain::ReviewRecord& review) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "INSERT INTO reviews (item_id, rating, sentiment_raw) VALUES (?, ?, ?)");
  if (!stmt.is_valid()) {
    throw std::runtime_error("review append: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, review.item_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt.get(), 2, review.rating);
  sqlite3_bind_text(stmt.get(), 3, review.sentiment_raw.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("review append: ") + sqlite3_errmsg(db_->connection()));
  }
}

std::vector<domain::ReviewRecord> SqliteReviewRepository::list_all() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT item_id, rating, sentiment_raw FROM reviews"
                         " ORDER BY item_id, review_idx");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<domain::ReviewRecord> reviews;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    domain::ReviewRecord r;
    r.item_id = core::ItemId{column_text(stmt.get(), 0)};
    r.rating = sqlite3_column_double(stmt.get(), 1);
    r.sentiment_raw = column_text(stmt.get(), 2);
    reviews.push_back(std::move(r));
  }
  return reviews;
}

}  // namespace prodsim::storage::sqlite
