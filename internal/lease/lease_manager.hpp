#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/store/item_store.hpp"
#include "lease.hpp"

namespace labelq::lease {

/*
  Hands out items under time-bounded reservations.

  Every reservation is stamped with a token that is unique for the life of
  the store: a per-process random salt, a monotonic sequence number and a
  random UUID. Expiry is lazy; an expired reservation is simply eligible
  again at the next Acquire().
*/
class LeaseManager {
public:
  LeaseManager(std::shared_ptr<labelq::store::ItemStore> store, std::chrono::milliseconds lease_duration);

  std::optional<Lease> Acquire();

  // Marks the item Done. Throws util::ReservationInvalid unless token is the
  // item's live reservation.
  void ValidateAndFinish(uint64_t item_id, const std::string& token, const labelq::model::Labels& labels, bool skipped);

  // Returns the item to Pending. Same token rules as ValidateAndFinish.
  void Release(uint64_t item_id, const std::string& token);

  std::chrono::milliseconds LeaseDuration() const { return lease_duration_; }

private:
  std::string GenerateToken();

  void ThrowIfRejected(labelq::store::ReservationCheck check, uint64_t item_id, const char* operation);

  std::shared_ptr<labelq::store::ItemStore> store_;
  std::chrono::milliseconds                 lease_duration_;

  std::string           salt_;
  std::atomic<uint64_t> sequence_{0};
};

}
