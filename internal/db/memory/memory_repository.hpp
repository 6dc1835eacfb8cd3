#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace labelq::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by id so FindNextEligible/ListItems walk in id order
    std::map<uint64_t, model::ItemRecord> items;
    std::unordered_map<std::string, uint64_t> ids_by_name;
    uint64_t next_item_id = 1;
  };

  // Held by a MemoryTransaction from Begin() until it finishes.
  std::mutex mutex_;
  State committed_;
};

}
