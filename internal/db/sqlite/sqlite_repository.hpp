#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace labelq::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertItemIfAbsent(Transaction&, const std::string& name, uint64_t now_ms) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, uint64_t id) override;
  std::optional<model::ItemRecord> GetItemByName(Transaction&, const std::string& name) override;
  std::optional<model::ItemRecord> FindNextEligible(Transaction&, uint64_t now_ms) override;
  Result UpdateItem(Transaction&, const model::ItemRecord&) override;
  std::vector<model::ItemRecord> ListItems(Transaction&, const ItemFilter& filter) override;
  std::vector<std::string> ListNames(Transaction&) override;
  labelq::model::ItemCounts CountItems(Transaction&, uint64_t now_ms) override;
  Result ReleaseAllReservations(Transaction&, uint64_t now_ms, uint64_t* released) override;

  // Creates the items table and index if missing.
  static void BootstrapSchema(SqliteDB& db);

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static std::runtime_error Error(sqlite3* db, const char* what);
};

}
