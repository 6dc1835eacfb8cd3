#include "pg_repository.hpp"

#include <optional>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace labelq::db::postgres {

using labelq::model::ItemState;

namespace {

model::ItemRecord ReadItem(const pqxx::row& row) {
  model::ItemRecord r;
  r.id               = row[0].as<uint64_t>();
  r.name             = row[1].c_str();
  const auto state   = labelq::model::ParseItemState(row[2].c_str());
  if (!state) {
    throw std::runtime_error("Corrupt items row " + std::to_string(r.id) + ": unknown state '" + row[2].c_str() + "'");
  }
  r.state             = *state;
  r.labels_json       = row[3].is_null() ? "" : row[3].c_str();
  r.skipped           = row[4].as<bool>();
  r.reservation_token = row[5].is_null() ? "" : row[5].c_str();
  r.reserved_at_ms    = row[6].is_null() ? 0 : row[6].as<uint64_t>();
  r.expires_at_ms     = row[7].is_null() ? 0 : row[7].as<uint64_t>();
  r.updated_at_ms     = row[8].as<uint64_t>();
  return r;
}

std::optional<std::string> TextOrNull(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<uint64_t> U64OrNull(uint64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

// Runs on a dedicated connection: pooled connections prepare statements
// against the items table, which does not exist yet on a fresh database.
void PgRepository::BootstrapSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS items ("
          " id BIGSERIAL PRIMARY KEY,"
          " name TEXT NOT NULL UNIQUE,"
          " state TEXT NOT NULL DEFAULT 'pending',"
          " labels_json JSONB,"
          " skipped BOOLEAN NOT NULL DEFAULT FALSE,"
          " reservation_token TEXT,"
          " reserved_at_ms BIGINT,"
          " expires_at_ms BIGINT,"
          " updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS items_eligible_idx ON items(state, expires_at_ms, id);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertItemIfAbsent(Transaction& t, const std::string& name, uint64_t now_ms) {
  try {
    TX(t).Work().exec_prepared("insert_item_if_absent", name, now_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ItemRecord> PgRepository::GetItem(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_item_for_update", id);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

std::optional<model::ItemRecord> PgRepository::GetItemByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_item_by_name", name);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

std::optional<model::ItemRecord> PgRepository::FindNextEligible(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("next_eligible", now_ms);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

Result PgRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_item", r.id, std::string(labelq::model::ToString(r.state)), TextOrNull(r.labels_json),
                                          r.skipped, TextOrNull(r.reservation_token), U64OrNull(r.reserved_at_ms),
                                          U64OrNull(r.expires_at_ms), r.updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "item " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ItemRecord> PgRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  auto& work = TX(t).Work();

  pqxx::result res;
  if (filter.state) {
    res = work.exec_params("SELECT " LABELQ_PG_ITEM_COLUMNS " FROM items"
                           " WHERE (CASE WHEN state='reserved' AND expires_at_ms<=$1 THEN 'pending' ELSE state END)=$2"
                           " ORDER BY id LIMIT $3 OFFSET $4;",
                           filter.now_ms, std::string(labelq::model::ToString(*filter.state)), filter.page.limit, filter.page.offset);
  } else {
    res = work.exec_params("SELECT " LABELQ_PG_ITEM_COLUMNS " FROM items ORDER BY id LIMIT $1 OFFSET $2;", filter.page.limit,
                           filter.page.offset);
  }

  std::vector<model::ItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadItem(row));
  }
  return out;
}

std::vector<std::string> PgRepository::ListNames(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT name FROM items;");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

labelq::model::ItemCounts PgRepository::CountItems(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("count_items", now_ms);

  labelq::model::ItemCounts counts;
  counts.pending       = res[0][0].as<uint64_t>();
  counts.reserved_live = res[0][1].as<uint64_t>();
  counts.done          = res[0][2].as<uint64_t>();
  counts.skipped       = res[0][3].as<uint64_t>();
  counts.total         = res[0][4].as<uint64_t>();
  return counts;
}

Result PgRepository::ReleaseAllReservations(Transaction& t, uint64_t now_ms, uint64_t* released) {
  try {
    auto res = TX(t).Work().exec_prepared("release_all", now_ms);
    if (released) *released = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace labelq::db::postgres
