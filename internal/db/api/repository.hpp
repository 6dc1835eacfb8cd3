#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/model/item.hpp"

namespace labelq::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Two transactions never interleave their select-then-update sequences
    on the same row (see Transaction)
  - Reservation correctness depends on this behavior

  The DB is the source of truth for item state; nothing above it caches
  reservations.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  // Inserts a Pending row for name. An existing name is not an error.
  virtual Result InsertItemIfAbsent(Transaction&, const std::string& name, uint64_t now_ms) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::ItemRecord> GetItemByName(Transaction&, const std::string& name) = 0;

  // Lowest-id row that is Pending, or Reserved with expires_at_ms <= now_ms.
  virtual std::optional<model::ItemRecord> FindNextEligible(Transaction&, uint64_t now_ms) = 0;

  virtual Result UpdateItem(Transaction&, const model::ItemRecord&) = 0;

  virtual std::vector<model::ItemRecord> ListItems(Transaction&, const ItemFilter& filter) = 0;

  // Names already known to the store, for discovery.
  virtual std::vector<std::string> ListNames(Transaction&) = 0;

  virtual labelq::model::ItemCounts CountItems(Transaction&, uint64_t now_ms) = 0;

  // Reverts every Reserved row to Pending; reports how many rows changed.
  virtual Result ReleaseAllReservations(Transaction&, uint64_t now_ms, uint64_t* released) = 0;
};

} // namespace labelq::db
