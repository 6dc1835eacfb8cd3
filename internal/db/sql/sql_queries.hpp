#pragma once

namespace labelq::db::sql {

/*
  Canonical SQL for the items table.

  IMPORTANT:
  These are written in the SQLite dialect with ? placeholders.
  The postgres backend keeps its own $n variants with row locks.
*/

static constexpr const char* CREATE_ITEMS =
    "CREATE TABLE IF NOT EXISTS items ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " name TEXT NOT NULL UNIQUE,"
    " state TEXT NOT NULL DEFAULT 'pending',"
    " labels_json TEXT,"
    " skipped INTEGER NOT NULL DEFAULT 0,"
    " reservation_token TEXT,"
    " reserved_at_ms INTEGER,"
    " expires_at_ms INTEGER,"
    " updated_at_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_ITEMS_ELIGIBLE_INDEX =
    "CREATE INDEX IF NOT EXISTS items_eligible_idx ON items(state, expires_at_ms, id);";

static constexpr const char* INSERT_ITEM_IF_ABSENT =
    "INSERT INTO items(name,state,skipped,updated_at_ms) VALUES(?,'pending',0,?)"
    " ON CONFLICT(name) DO NOTHING;";

#define LABELQ_ITEM_COLUMNS \
  "id,name,state,labels_json,skipped,reservation_token,reserved_at_ms,expires_at_ms,updated_at_ms"

// Same order for postgres, which stores labels as jsonb.
#define LABELQ_PG_ITEM_COLUMNS \
  "id,name,state,labels_json::text,skipped,reservation_token,reserved_at_ms,expires_at_ms,updated_at_ms"

static constexpr const char* SELECT_ITEM =
    "SELECT " LABELQ_ITEM_COLUMNS " FROM items WHERE id=?;";

static constexpr const char* SELECT_ITEM_BY_NAME =
    "SELECT " LABELQ_ITEM_COLUMNS " FROM items WHERE name=?;";

static constexpr const char* SELECT_NEXT_ELIGIBLE =
    "SELECT " LABELQ_ITEM_COLUMNS " FROM items"
    " WHERE state='pending' OR (state='reserved' AND expires_at_ms<=?)"
    " ORDER BY id LIMIT 1;";

static constexpr const char* UPDATE_ITEM =
    "UPDATE items SET state=?,labels_json=?,skipped=?,reservation_token=?,"
    "reserved_at_ms=?,expires_at_ms=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* LIST_ITEMS =
    "SELECT " LABELQ_ITEM_COLUMNS " FROM items ORDER BY id LIMIT ? OFFSET ?;";

static constexpr const char* LIST_ITEMS_BY_STATE =
    "SELECT " LABELQ_ITEM_COLUMNS " FROM items"
    " WHERE (CASE WHEN state='reserved' AND expires_at_ms<=? THEN 'pending' ELSE state END)=?"
    " ORDER BY id LIMIT ? OFFSET ?;";

static constexpr const char* LIST_NAMES =
    "SELECT name FROM items;";

static constexpr const char* COUNT_ITEMS =
    "SELECT"
    " COALESCE(SUM(CASE WHEN state='pending' OR (state='reserved' AND expires_at_ms<=?) THEN 1 ELSE 0 END),0),"
    " COALESCE(SUM(CASE WHEN state='reserved' AND expires_at_ms>? THEN 1 ELSE 0 END),0),"
    " COALESCE(SUM(CASE WHEN state='done' THEN 1 ELSE 0 END),0),"
    " COALESCE(SUM(CASE WHEN state='done' AND skipped=1 THEN 1 ELSE 0 END),0),"
    " COUNT(*)"
    " FROM items;";

static constexpr const char* RELEASE_ALL_RESERVATIONS =
    "UPDATE items SET state='pending',reservation_token=NULL,reserved_at_ms=NULL,"
    "expires_at_ms=NULL,updated_at_ms=? WHERE state='reserved';";

} // namespace labelq::db::sql
