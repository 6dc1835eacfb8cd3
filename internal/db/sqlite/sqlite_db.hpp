#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace labelq::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every request thread. Transactions on it
  must not overlap, so SqliteTransaction holds TxMutex() from BEGIN to
  COMMIT/ROLLBACK; the busy timeout only matters for other processes.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control).
  // Throws util::StoreBusy when the database stays locked past the busy timeout.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode, int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace labelq::db::sqlite
