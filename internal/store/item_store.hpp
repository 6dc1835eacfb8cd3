#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/item.hpp"
#include "internal/util/time.hpp"

namespace labelq::store {

// Outcome of checking a presented token against an item's reservation.
enum class ReservationCheck {
  kOk,
  kNoSuchItem,
  kNotReserved,
  kAlreadyDone,
  kTokenMismatch,
  kExpired,
};

/*
  ItemStore

  Durable record of every work item. Each public call is exactly one
  repository transaction, so a call either commits completely or leaves
  no trace. The repository's writer serialization is what makes
  TryReserve and CommitTerminal safe against each other.

  Backend failures surface as exceptions (StoreBusy for lock timeouts,
  std::runtime_error otherwise).
*/
class ItemStore {
 public:
  explicit ItemStore(std::shared_ptr<labelq::db::Repository> repository, labelq::util::NowFn now = labelq::util::Now);

  labelq::model::Item UpsertIfAbsent(const std::string& name);

  // Reserves the lowest-id eligible item under token. Empty if none.
  std::optional<labelq::model::Item> TryReserve(const std::string& token, std::chrono::milliseconds lease_duration);

  ReservationCheck CommitTerminal(uint64_t id, const std::string& token, const labelq::model::Labels& labels, bool skipped);

  ReservationCheck Release(uint64_t id, const std::string& token);

  labelq::model::ItemCounts Counts();

  uint64_t ReleaseAll();

  std::optional<labelq::model::Item> Get(uint64_t id);
  std::vector<labelq::model::Item>   List(const labelq::db::ItemFilter& filter);

  std::unordered_set<std::string> KnownNames();

  labelq::util::TimePoint Now() const { return now_(); }

 private:
  static ReservationCheck Check(const std::optional<labelq::db::model::ItemRecord>& record, const std::string& token, uint64_t now_ms);

  std::shared_ptr<labelq::db::Repository> repository_;
  labelq::util::NowFn                     now_;
};

} // namespace labelq::store
