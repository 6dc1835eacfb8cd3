#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace labelq::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  static void BootstrapSchema(const std::string& conninfo);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
