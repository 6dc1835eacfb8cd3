#include "lease_manager.hpp"

#include <cstdio>
#include <random>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace labelq::lease {

namespace {

std::string RandomSalt() {
  std::random_device rd;
  const uint64_t     salt = (static_cast<uint64_t>(rd()) << 32) | rd();
  char               buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(salt));
  return buf;
}

labelq::util::ReservationInvalid::Reason ToReason(labelq::store::ReservationCheck check) {
  using Reason = labelq::util::ReservationInvalid::Reason;
  switch (check) {
    case labelq::store::ReservationCheck::kNoSuchItem:
      return Reason::kNoSuchItem;
    case labelq::store::ReservationCheck::kNotReserved:
      return Reason::kNotReserved;
    case labelq::store::ReservationCheck::kAlreadyDone:
      return Reason::kAlreadyDone;
    case labelq::store::ReservationCheck::kTokenMismatch:
      return Reason::kTokenMismatch;
    case labelq::store::ReservationCheck::kExpired:
      return Reason::kExpired;
    case labelq::store::ReservationCheck::kOk:
      break;
  }
  throw std::logic_error("reservation check passed; no rejection reason");
}

} // namespace

LeaseManager::LeaseManager(std::shared_ptr<labelq::store::ItemStore> store, std::chrono::milliseconds lease_duration)
    : store_(std::move(store)), lease_duration_(lease_duration), salt_(RandomSalt()) {
  if (!store_) throw std::invalid_argument("lease manager: item store is required");
  if (lease_duration_.count() < 0) throw std::invalid_argument("lease manager: lease duration must not be negative");
}

std::string LeaseManager::GenerateToken() {
  char seq[17];
  std::snprintf(seq, sizeof(seq), "%llx", static_cast<unsigned long long>(sequence_.fetch_add(1, std::memory_order_relaxed)));
  return salt_ + "." + seq + "." + labelq::util::ToString(labelq::util::GenerateUUID());
}

std::optional<Lease> LeaseManager::Acquire() {
  auto token = GenerateToken();
  auto item  = store_->TryReserve(token, lease_duration_);
  if (!item.has_value()) return std::nullopt;

  Lease lease;
  lease.expires_at = item->reservation->expires_at;
  lease.token      = std::move(token);
  lease.item       = std::move(*item);

  labelq::observability::Metrics::Instance().RecordLeaseIssued();
  LABELQ_LOG_DEBUG("lease issued", {labelq::observability::IntField("item_id", static_cast<int64_t>(lease.item.id)),
                                    labelq::observability::StringField("name", lease.item.name)});
  return lease;
}

void LeaseManager::ThrowIfRejected(labelq::store::ReservationCheck check, uint64_t item_id, const char* operation) {
  if (check == labelq::store::ReservationCheck::kOk) return;

  const auto reason = ToReason(check);
  labelq::observability::Metrics::Instance().RecordReservationRejected(labelq::util::ToString(reason));
  LABELQ_LOG_WARN("reservation rejected", {labelq::observability::StringField("operation", operation),
                                           labelq::observability::IntField("item_id", static_cast<int64_t>(item_id)),
                                           labelq::observability::StringField("reason", labelq::util::ToString(reason))});
  throw labelq::util::ReservationInvalid(reason, std::string(operation) + ": reservation is no longer valid; request a new item");
}

void LeaseManager::ValidateAndFinish(uint64_t item_id, const std::string& token, const labelq::model::Labels& labels, bool skipped) {
  ThrowIfRejected(store_->CommitTerminal(item_id, token, labels, skipped), item_id, skipped ? "skip" : "submit");
}

void LeaseManager::Release(uint64_t item_id, const std::string& token) {
  ThrowIfRejected(store_->Release(item_id, token), item_id, "release");
}

}
