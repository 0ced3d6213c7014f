#include "adapters/SqliteBarDataSource.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace adapter {

namespace {

long long resolution_ms(trade::Duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

trade::Decimal column_decimal(sqlite3_stmt* stmt, int col) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  if (!text) {
    throw std::runtime_error("NULL price in bars table");
  }
  return trade::Decimal::parse(text);
}

}

SqliteBarDataSource::SqliteBarDataSource(const SqliteBarStoreConfig& config)
    : config_(config) {
  int rc = sqlite3_open(config_.db_path.c_str(), &db_);
  if (rc != SQLITE_OK) {
    std::string msg = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    if (db_) sqlite3_close(db_);
    throw std::runtime_error(msg);
  }

  std::cout << "[SqliteBarDataSource] Opened database: " << config_.db_path << "\n";
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

SqliteBarDataSource::~SqliteBarDataSource() {
  try {
    flush();
  } catch (const std::exception& e) {
    std::cerr << "[SqliteBarDataSource] Error flushing on shutdown: " << e.what() << "\n";
  }

  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteBarDataSource::ensure_schema() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  db_ensure_schema();
}

void SqliteBarDataSource::db_ensure_schema() {
  exec_sql("PRAGMA journal_mode=WAL;");
  exec_sql("PRAGMA synchronous=NORMAL;");
  exec_sql("PRAGMA temp_store=MEMORY;");
  exec_sql("PRAGMA busy_timeout=" + std::to_string(config_.busy_timeout_ms) + ";");

  exec_sql("CREATE TABLE IF NOT EXISTS schema_version(version INTEGER NOT NULL);");

  int v = query_int("SELECT version FROM schema_version LIMIT 1;", 0);

  exec_sql("BEGIN;");
  try {
    if (v < 1) {
      exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS bars(
          pair TEXT NOT NULL,
          resolution_ms INTEGER NOT NULL,
          open_time_ms INTEGER NOT NULL,
          open TEXT NOT NULL,
          high TEXT NOT NULL,
          low TEXT NOT NULL,
          close TEXT NOT NULL,
          ingestion_time DATETIME DEFAULT CURRENT_TIMESTAMP,
          PRIMARY KEY(pair, resolution_ms, open_time_ms)
        );
      )SQL");

      exec_sql("DELETE FROM schema_version;");
      exec_sql("INSERT INTO schema_version(version) VALUES (1);");
      v = 1;

      std::cout << "[SqliteBarDataSource] Schema initialized (v1)\n";
    }

    exec_sql("COMMIT;");
  } catch (const std::exception& e) {
    exec_sql("ROLLBACK;");
    throw;
  }
}

void SqliteBarDataSource::add_bar(const trade::AssetPair& pair, trade::Duration bar_duration,
                                  const trade::Bar& bar) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    bars_write_buffer_.push_back({pair.to_string(), resolution_ms(bar_duration), bar});
    full = bars_write_buffer_.size() >= config_.bar_buffer_size;
  }

  if (full) {
    flush();
  }
}

void SqliteBarDataSource::add_bars(const std::vector<trade::BarRecord>& records) {
  for (const auto& rec : records) {
    add_bar(rec.pair, rec.duration, rec.bar);
  }
}

void SqliteBarDataSource::flush() {
  flush_pending();
}

void SqliteBarDataSource::flush_pending() const {
  std::vector<PendingBar> to_flush;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    to_flush.swap(bars_write_buffer_);
  }

  if (to_flush.empty()) return;

  try {
    std::lock_guard<std::mutex> lock(db_mutex_);
    db_batch_insert_bars(to_flush);
  } catch (const std::exception& e) {
    // Put the batch back ahead of anything buffered since.
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    to_flush.insert(to_flush.end(), std::make_move_iterator(bars_write_buffer_.begin()),
                    std::make_move_iterator(bars_write_buffer_.end()));
    bars_write_buffer_.swap(to_flush);
    std::cerr << "[SqliteBarDataSource] Flush failed, " << bars_write_buffer_.size()
              << " bars kept in buffer: " << e.what() << "\n";
    throw;
  }

#ifdef TRADE_DEBUG
  std::cout << "[SqliteBarDataSource] Flushed " << to_flush.size() << " bars to DB\n";
#endif
}

void SqliteBarDataSource::db_batch_insert_bars(const std::vector<PendingBar>& batch) const {
  if (batch.empty()) return;

  sqlite3_stmt* stmt = nullptr;
  const char* sql = R"SQL(
    INSERT OR REPLACE INTO bars(pair, resolution_ms, open_time_ms, open, high, low, close)
    VALUES(?, ?, ?, ?, ?, ?, ?);
  )SQL";

  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
  }

  bool in_transaction = false;
  try {
    exec_sql("BEGIN TRANSACTION;");
    in_transaction = true;

    for (const auto& pending : batch) {
      const trade::Bar& bar = pending.bar;

      sqlite3_bind_text(stmt, 1, pending.pair.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int64(stmt, 2, pending.resolution_ms);
      sqlite3_bind_int64(stmt, 3, trade::to_epoch_ms(bar.date_time));
      sqlite3_bind_text(stmt, 4, bar.open.to_string().c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(stmt, 5, bar.high.to_string().c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(stmt, 6, bar.low.to_string().c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(stmt, 7, bar.close.to_string().c_str(), -1, SQLITE_TRANSIENT);

      rc = sqlite3_step(stmt);
      if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert bar: ") + sqlite3_errmsg(db_));
      }
      sqlite3_reset(stmt);
    }
    exec_sql("COMMIT;");
  } catch (const std::exception& e) {
    sqlite3_finalize(stmt);
    if (in_transaction && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      std::cerr << "[SqliteBarDataSource] Rollback failed: " << sqlite3_errmsg(db_) << "\n";
    }
    throw;
  }
  sqlite3_finalize(stmt);
}

std::optional<trade::Bar> SqliteBarDataSource::get_bar(const trade::AssetPair& pair,
                                                       trade::TimePoint at,
                                                       trade::Duration bar_duration) const {
  flush_pending();

  std::lock_guard<std::mutex> lock(db_mutex_);
  return db_query_bar(pair.to_string(), resolution_ms(bar_duration), trade::to_epoch_ms(at));
}

std::optional<trade::Bar> SqliteBarDataSource::db_query_bar(const std::string& pair,
                                                            long long resolution_ms,
                                                            long long at_ms) const {
  sqlite3_stmt* stmt = nullptr;
  const char* sql = R"SQL(
    SELECT open_time_ms, open, high, low, close
    FROM bars
    WHERE pair = ? AND resolution_ms = ? AND open_time_ms <= ?
    ORDER BY open_time_ms DESC
    LIMIT 1;
  )SQL";

  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare query: ") + sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, pair.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, resolution_ms);
  sqlite3_bind_int64(stmt, 3, at_ms);

  std::optional<trade::Bar> result;
  try {
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      trade::Bar bar;
      bar.date_time = trade::from_epoch_ms(sqlite3_column_int64(stmt, 0));
      bar.open = column_decimal(stmt, 1);
      bar.high = column_decimal(stmt, 2);
      bar.low = column_decimal(stmt, 3);
      bar.close = column_decimal(stmt, 4);
      result = bar;
    } else if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("Failed to query bar: ") + sqlite3_errmsg(db_));
    }
  } catch (const std::exception& e) {
    sqlite3_finalize(stmt);
    throw;
  }

  sqlite3_finalize(stmt);
  return result;
}

long long SqliteBarDataSource::count_bars() const {
  flush_pending();

  std::lock_guard<std::mutex> lock(db_mutex_);
  return query_int("SELECT COUNT(*) FROM bars;", 0);
}

void SqliteBarDataSource::clear_all() {
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    bars_write_buffer_.clear();
  }

  {
    std::lock_guard<std::mutex> lock(db_mutex_);
    exec_sql("DELETE FROM bars;");
  }

  std::cout << "[SqliteBarDataSource] Cleared all bars\n";
}

void SqliteBarDataSource::exec_sql(const std::string& sql) const {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg ? err_msg : "Unknown error";
    if (err_msg) sqlite3_free(err_msg);
    throw std::runtime_error("SQL error: " + error);
  }
}

int SqliteBarDataSource::query_int(const std::string& sql, int default_value) const {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return default_value;
  }

  int result = default_value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    result = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return result;
}

} // namespace adapter
