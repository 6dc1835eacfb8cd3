#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace labelq::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_item_if_absent",
               "INSERT INTO items(name,state,skipped,updated_at_ms) VALUES($1,'pending',FALSE,$2) "
               "ON CONFLICT(name) DO NOTHING");

  // Row locks: a reader that gates a state transition must hold the row
  // until its transaction ends.
  conn.prepare("get_item_for_update",
               "SELECT " LABELQ_PG_ITEM_COLUMNS " FROM items WHERE id=$1 FOR UPDATE");

  conn.prepare("get_item_by_name",
               "SELECT " LABELQ_PG_ITEM_COLUMNS " FROM items WHERE name=$1");

  // SKIP LOCKED lets concurrent acquirers fall through to the next row
  // instead of queueing behind each other.
  conn.prepare("next_eligible",
               "SELECT " LABELQ_PG_ITEM_COLUMNS " FROM items "
               "WHERE state='pending' OR (state='reserved' AND expires_at_ms<=$1) "
               "ORDER BY id LIMIT 1 FOR UPDATE SKIP LOCKED");

  conn.prepare("update_item",
               "UPDATE items SET state=$2,labels_json=$3::jsonb,skipped=$4,reservation_token=$5,"
               "reserved_at_ms=$6,expires_at_ms=$7,updated_at_ms=$8 WHERE id=$1");

  conn.prepare("count_items",
               "SELECT "
               "COUNT(*) FILTER (WHERE state='pending' OR (state='reserved' AND expires_at_ms<=$1)),"
               "COUNT(*) FILTER (WHERE state='reserved' AND expires_at_ms>$1),"
               "COUNT(*) FILTER (WHERE state='done'),"
               "COUNT(*) FILTER (WHERE state='done' AND skipped),"
               "COUNT(*) FROM items");

  conn.prepare("release_all",
               "UPDATE items SET state='pending',reservation_token=NULL,reserved_at_ms=NULL,"
               "expires_at_ms=NULL,updated_at_ms=$1 WHERE state='reserved'");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace labelq::db::postgres
