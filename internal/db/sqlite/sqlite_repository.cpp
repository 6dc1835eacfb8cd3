#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace labelq::db::sqlite {

using labelq::db::ErrorCode;
using labelq::db::Result;
using labelq::model::ItemState;

namespace {

/*
  RAII for sqlite3_stmt so every early return finalizes.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 means "no value" for the optional timestamp columns
void BindU64OrNull(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::ItemRecord ReadItem(sqlite3_stmt* st) {
  model::ItemRecord r;
  r.id                = ColU64(st, 0);
  r.name              = ColText(st, 1);
  const auto state    = labelq::model::ParseItemState(ColText(st, 2));
  if (!state) {
    throw std::runtime_error("Corrupt items row " + std::to_string(r.id) + ": unknown state '" + ColText(st, 2) + "'");
  }
  r.state             = *state;
  r.labels_json       = ColText(st, 3);
  r.skipped           = sqlite3_column_int(st, 4) != 0;
  r.reservation_token = ColText(st, 5);
  r.reserved_at_ms    = ColU64(st, 6);
  r.expires_at_ms     = ColU64(st, 7);
  r.updated_at_ms     = ColU64(st, 8);
  return r;
}

std::string StateText(ItemState state) {
  return std::string(labelq::model::ToString(state));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(sql::CREATE_ITEMS);
  db.Exec(sql::CREATE_ITEMS_ELIGIBLE_INDEX);
  db.Exec("SELECT " LABELQ_ITEM_COLUMNS " FROM items LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// Read paths have no Result to carry a failure, so they throw.
std::runtime_error SqliteRepository::Error(sqlite3* db, const char* what) {
    return std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItemIfAbsent(Transaction& t, const std::string& name, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_ITEM_IF_ABSENT);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, name);
    BindU64(st.get(), 2, now_ms);

    return Translate(db, st.Step());
}

std::optional<model::ItemRecord>
SqliteRepository::GetItem(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_ITEM);
    if (!st.ok()) throw Error(db, "sqlite prepare SELECT_ITEM");

    BindU64(st.get(), 1, id);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw Error(db, "sqlite step SELECT_ITEM");
    return ReadItem(st.get());
}

std::optional<model::ItemRecord>
SqliteRepository::GetItemByName(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_ITEM_BY_NAME);
    if (!st.ok()) throw Error(db, "sqlite prepare SELECT_ITEM_BY_NAME");

    BindText(st.get(), 1, name);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw Error(db, "sqlite step SELECT_ITEM_BY_NAME");
    return ReadItem(st.get());
}

std::optional<model::ItemRecord>
SqliteRepository::FindNextEligible(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_NEXT_ELIGIBLE);
    if (!st.ok()) throw Error(db, "sqlite prepare SELECT_NEXT_ELIGIBLE");

    BindU64(st.get(), 1, now_ms);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw Error(db, "sqlite step SELECT_NEXT_ELIGIBLE");
    return ReadItem(st.get());
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_ITEM);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, StateText(r.state));
    BindTextOrNull(st.get(), 2, r.labels_json);
    sqlite3_bind_int(st.get(), 3, r.skipped ? 1 : 0);
    BindTextOrNull(st.get(), 4, r.reservation_token);
    BindU64OrNull(st.get(), 5, r.reserved_at_ms);
    BindU64OrNull(st.get(), 6, r.expires_at_ms);
    BindU64(st.get(), 7, r.updated_at_ms);
    BindU64(st.get(), 8, r.id);

    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "item " + std::to_string(r.id));
    return Result::Ok();
}

std::vector<model::ItemRecord>
SqliteRepository::ListItems(Transaction& t, const ItemFilter& filter) {
    auto* db = TX(t).Handle();

    Statement st(db, filter.state ? sql::LIST_ITEMS_BY_STATE : sql::LIST_ITEMS);
    if (!st.ok()) throw Error(db, "sqlite prepare LIST_ITEMS");

    int idx = 1;
    if (filter.state) {
        BindU64(st.get(), idx++, filter.now_ms);
        BindText(st.get(), idx++, StateText(*filter.state));
    }
    BindU64(st.get(), idx++, filter.page.limit);
    BindU64(st.get(), idx++, filter.page.offset);

    std::vector<model::ItemRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadItem(st.get()));
    }
    if (rc != SQLITE_DONE) throw Error(db, "sqlite step LIST_ITEMS");
    return out;
}

std::vector<std::string> SqliteRepository::ListNames(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::LIST_NAMES);
    if (!st.ok()) throw Error(db, "sqlite prepare LIST_NAMES");

    std::vector<std::string> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    if (rc != SQLITE_DONE) throw Error(db, "sqlite step LIST_NAMES");
    return out;
}

labelq::model::ItemCounts SqliteRepository::CountItems(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::COUNT_ITEMS);
    if (!st.ok()) throw Error(db, "sqlite prepare COUNT_ITEMS");

    BindU64(st.get(), 1, now_ms);
    BindU64(st.get(), 2, now_ms);

    if (st.Step() != SQLITE_ROW) throw Error(db, "sqlite step COUNT_ITEMS");

    labelq::model::ItemCounts counts;
    counts.pending       = ColU64(st.get(), 0);
    counts.reserved_live = ColU64(st.get(), 1);
    counts.done          = ColU64(st.get(), 2);
    counts.skipped       = ColU64(st.get(), 3);
    counts.total         = ColU64(st.get(), 4);
    return counts;
}

Result SqliteRepository::ReleaseAllReservations(Transaction& t, uint64_t now_ms, uint64_t* released) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::RELEASE_ALL_RESERVATIONS);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, now_ms);

    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (released) *released = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

} // namespace labelq::db::sqlite
