#pragma once

#include "trade/IBarDataSource.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

/*
SqliteBarDataSource:
  Persistent SQLite storage for historical bars.

  Write path (loading a data set):
    - Bars buffered in memory
    - Flushed to SQLite in one transaction when the buffer reaches its
      threshold, on flush(), and on destruction

  Read path (simulation):
    - Pending writes are flushed first so reads always see them
    - Latest bar at or before the requested time, per pair and resolution

  Prices are stored as TEXT so decimals come back exactly as written.
*/

namespace adapter {

struct SqliteBarStoreConfig {
  std::string db_path{"bars.db"};     // ":memory:" for a throwaway store
  size_t bar_buffer_size{50000};      // Flush bars when buffer reaches this size
  int busy_timeout_ms{5000};          // Wait this long on a database locked by another writer
};

class SqliteBarDataSource : public trade::IBarDataSource {
public:
  explicit SqliteBarDataSource(const SqliteBarStoreConfig& config = SqliteBarStoreConfig());
  ~SqliteBarDataSource() override;

  SqliteBarDataSource(const SqliteBarDataSource&) = delete;
  SqliteBarDataSource& operator=(const SqliteBarDataSource&) = delete;

  // Initialize database schema (idempotent)
  void ensure_schema();

  // Write operations (buffered). A bar with the same pair, resolution and
  // open time replaces the stored one.
  void add_bar(const trade::AssetPair& pair, trade::Duration bar_duration, const trade::Bar& bar);
  void add_bars(const std::vector<trade::BarRecord>& records);

  // Throws std::runtime_error if the insert fails; the bars stay buffered.
  void flush();

  std::optional<trade::Bar> get_bar(const trade::AssetPair& pair,
                                    trade::TimePoint at,
                                    trade::Duration bar_duration) const override;

  // Number of stored bars (after flushing)
  long long count_bars() const;

  void clear_all();

private:
  struct PendingBar {
    std::string pair;
    long long resolution_ms;
    trade::Bar bar;
  };

  SqliteBarStoreConfig config_;
  sqlite3* db_{nullptr};

  // Thread safety
  mutable std::mutex buffer_mutex_;
  mutable std::mutex db_mutex_;

  mutable std::vector<PendingBar> bars_write_buffer_;

  void flush_pending() const;

  // DB operations (must hold db_mutex_)
  void db_ensure_schema();
  void db_batch_insert_bars(const std::vector<PendingBar>& batch) const;
  std::optional<trade::Bar> db_query_bar(const std::string& pair, long long resolution_ms,
                                         long long at_ms) const;

  // Utility
  void exec_sql(const std::string& sql) const;
  int query_int(const std::string& sql, int default_value = 0) const;
};

} // namespace adapter
