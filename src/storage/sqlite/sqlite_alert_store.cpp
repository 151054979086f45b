#include "prodsim/storage/sqlite/sqlite_alert_store.h"

#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace prodsim::storage::sqlite {

namespace {

constexpr const char* kAlertColumns =
    "SELECT item_id, risk_level, rule_id, positive_reviews, negative_reviews, avg_rating,"
    "       review_count, avg_sentiment, explanation, generated_at_ms FROM quality_alerts";

domain::QualityAlert read_alert(sqlite3_stmt* stmt) {
  domain::QualityAlert alert;
  alert.item_id = core::ItemId{column_text(stmt, 0)};
  alert.risk_level =
      domain::risk_level_from_string(column_text(stmt, 1)).value_or(domain::RiskLevel::kOk);
  alert.rule_id = column_text(stmt, 2);

  alert.evidence.item_id = alert.item_id;
  alert.evidence.positive_reviews = sqlite3_column_int(stmt, 3);
  alert.evidence.negative_reviews = sqlite3_column_int(stmt, 4);
  alert.evidence.avg_rating = sqlite3_column_double(stmt, 5);
  alert.evidence.review_count = sqlite3_column_int(stmt, 6);
  if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
    alert.evidence.avg_sentiment = sqlite3_column_double(stmt, 7);
  }
  if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
    alert.explanation = column_text(stmt, 8);
  }
  alert.generated_at = core::from_unix_millis(sqlite3_column_int64(stmt, 9));
  return alert;
}

}  // namespace

SqliteAlertStore::SqliteAlertStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAlertStore::replace_all(const std::vector<domain::QualityAlert>& alerts) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  sqlite3* conn = db_->connection();

  Transaction tx(*db_);
  if (!tx.begun()) {
    throw std::runtime_error(std::string("alert store: begin: ") + sqlite3_errmsg(conn));
  }

  auto cleared = db_->exec("DELETE FROM quality_alerts");
  if (!cleared.has_value()) {
    throw std::runtime_error("alert store: " + cleared.error());
  }

  PreparedStatement stmt(conn, R"(
    INSERT INTO quality_alerts
      (item_id, risk_level, severity, rule_id, positive_reviews, negative_reviews,
       avg_rating, review_count, avg_sentiment, explanation, generated_at_ms)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    throw std::runtime_error("alert store: prepare insert: " + stmt.error());
  }

  for (const auto& alert : alerts) {
    stmt.reset();
    const std::string level = domain::risk_level_to_string(alert.risk_level);
    sqlite3_bind_text(stmt.get(), 1, alert.item_id.value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, level.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, static_cast<int>(alert.risk_level));
    sqlite3_bind_text(stmt.get(), 4, alert.rule_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 5, alert.evidence.positive_reviews);
    sqlite3_bind_int(stmt.get(), 6, alert.evidence.negative_reviews);
    sqlite3_bind_double(stmt.get(), 7, alert.evidence.avg_rating);
    sqlite3_bind_int(stmt.get(), 8, alert.evidence.review_count);
    if (alert.evidence.avg_sentiment.has_value()) {
      sqlite3_bind_double(stmt.get(), 9, alert.evidence.avg_sentiment.value());
    } else {
      sqlite3_bind_null(stmt.get(), 9);
    }
    if (alert.explanation.has_value()) {
      sqlite3_bind_text(stmt.get(), 10, alert.explanation->c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(stmt.get(), 10);
    }
    sqlite3_bind_int64(stmt.get(), 11, core::to_unix_millis(alert.generated_at));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      throw std::runtime_error("alert store: insert " + alert.item_id.value + ": " +
                               sqlite3_errmsg(conn));
    }
  }

  auto committed = tx.commit();
  if (!committed.has_value()) {
    throw std::runtime_error("alert store: " + committed.error());
  }
}

std::optional<domain::QualityAlert> SqliteAlertStore::get(const core::ItemId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string(kAlertColumns) + " WHERE item_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_alert(stmt.get());
  }
  return std::nullopt;
}

std::vector<domain::QualityAlert> SqliteAlertStore::list(const domain::RiskLevel min_level) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         std::string(kAlertColumns) +
                             " WHERE severity >= ? ORDER BY severity DESC, item_id ASC");
  if (!stmt.is_valid()) {
    return {};
  }
  sqlite3_bind_int(stmt.get(), 1, static_cast<int>(min_level));

  std::vector<domain::QualityAlert> alerts;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    alerts.push_back(read_alert(stmt.get()));
  }
  return alerts;
}

}  // namespace prodsim::storage::sqlite
