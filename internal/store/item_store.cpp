#include "item_store.hpp"

#include <stdexcept>

#include "internal/model/labels_codec.hpp"
#include "internal/util/errors.hpp"

namespace labelq::store {

using labelq::model::ItemState;

namespace {

void ThrowIfDbError(const labelq::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case labelq::db::ErrorCode::NotFound:
      throw labelq::util::NotFound(message);
    case labelq::db::ErrorCode::Busy:
      throw labelq::util::StoreBusy(message);
    default:
      throw std::runtime_error(message);
  }
}

void ClearReservation(labelq::db::model::ItemRecord& record) {
  record.reservation_token.clear();
  record.reserved_at_ms = 0;
  record.expires_at_ms  = 0;
}

labelq::model::Item ToItem(const labelq::db::model::ItemRecord& record) {
  labelq::model::Item item;
  item.id         = record.id;
  item.name       = record.name;
  item.state      = record.state;
  item.skipped    = record.skipped;
  item.labels     = labelq::model::LabelsFromJson(record.labels_json);
  item.updated_at = labelq::util::FromUnixMillis(record.updated_at_ms);
  if (record.state == ItemState::kReserved) {
    labelq::model::Reservation reservation;
    reservation.token       = record.reservation_token;
    reservation.reserved_at = labelq::util::FromUnixMillis(record.reserved_at_ms);
    reservation.expires_at  = labelq::util::FromUnixMillis(record.expires_at_ms);
    item.reservation        = std::move(reservation);
  }
  return item;
}

} // namespace

ItemStore::ItemStore(std::shared_ptr<labelq::db::Repository> repository, labelq::util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
  if (!repository_) throw std::invalid_argument("item store: repository is required");
  if (!now_) throw std::invalid_argument("item store: clock is required");
}

ReservationCheck ItemStore::Check(const std::optional<labelq::db::model::ItemRecord>& record, const std::string& token, uint64_t now_ms) {
  if (!record.has_value()) return ReservationCheck::kNoSuchItem;
  if (record->state == ItemState::kDone) return ReservationCheck::kAlreadyDone;
  if (record->state != ItemState::kReserved) return ReservationCheck::kNotReserved;
  if (record->reservation_token != token) return ReservationCheck::kTokenMismatch;
  if (now_ms >= record->expires_at_ms) return ReservationCheck::kExpired;
  return ReservationCheck::kOk;
}

labelq::model::Item ItemStore::UpsertIfAbsent(const std::string& name) {
  if (name.empty()) throw labelq::util::ValidationError("upsert item: name must not be empty");

  const auto now_ms = labelq::util::ToUnixMillis(now_());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertItemIfAbsent(*tx, name, now_ms), "upsert item");
  auto record = repository_->GetItemByName(*tx, name);
  if (!record.has_value()) throw std::runtime_error("upsert item: row for '" + name + "' missing after insert");
  tx->Commit();
  return ToItem(*record);
}

std::optional<labelq::model::Item> ItemStore::TryReserve(const std::string& token, std::chrono::milliseconds lease_duration) {
  if (token.empty()) throw labelq::util::ValidationError("reserve item: token must not be empty");

  const auto now_ms = labelq::util::ToUnixMillis(now_());

  auto tx     = repository_->Begin();
  auto record = repository_->FindNextEligible(*tx, now_ms);
  if (!record.has_value()) {
    tx->Commit();
    return std::nullopt;
  }

  record->state             = ItemState::kReserved;
  record->reservation_token = token;
  record->reserved_at_ms    = now_ms;
  record->expires_at_ms     = now_ms + static_cast<uint64_t>(lease_duration.count());
  record->updated_at_ms     = now_ms;
  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "reserve item");
  tx->Commit();
  return ToItem(*record);
}

ReservationCheck ItemStore::CommitTerminal(uint64_t id, const std::string& token, const labelq::model::Labels& labels, bool skipped) {
  const auto now_ms = labelq::util::ToUnixMillis(now_());

  auto       tx     = repository_->Begin();
  auto       record = repository_->GetItem(*tx, id);
  const auto check  = Check(record, token, now_ms);
  if (check != ReservationCheck::kOk) {
    tx->Rollback();
    return check;
  }

  record->state         = ItemState::kDone;
  record->skipped       = skipped;
  record->labels_json   = skipped ? std::string() : labelq::model::LabelsToJson(labels);
  record->updated_at_ms = now_ms;
  ClearReservation(*record);
  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "commit item");
  tx->Commit();
  return ReservationCheck::kOk;
}

ReservationCheck ItemStore::Release(uint64_t id, const std::string& token) {
  const auto now_ms = labelq::util::ToUnixMillis(now_());

  auto       tx     = repository_->Begin();
  auto       record = repository_->GetItem(*tx, id);
  const auto check  = Check(record, token, now_ms);
  if (check != ReservationCheck::kOk) {
    tx->Rollback();
    return check;
  }

  record->state         = ItemState::kPending;
  record->updated_at_ms = now_ms;
  ClearReservation(*record);
  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "release item");
  tx->Commit();
  return ReservationCheck::kOk;
}

labelq::model::ItemCounts ItemStore::Counts() {
  const auto now_ms = labelq::util::ToUnixMillis(now_());

  auto tx     = repository_->Begin();
  auto counts = repository_->CountItems(*tx, now_ms);
  tx->Commit();
  return counts;
}

uint64_t ItemStore::ReleaseAll() {
  const auto now_ms = labelq::util::ToUnixMillis(now_());

  uint64_t released = 0;
  auto     tx       = repository_->Begin();
  ThrowIfDbError(repository_->ReleaseAllReservations(*tx, now_ms, &released), "release all reservations");
  tx->Commit();
  return released;
}

std::optional<labelq::model::Item> ItemStore::Get(uint64_t id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, id);
  tx->Commit();
  if (!record.has_value()) return std::nullopt;
  return ToItem(*record);
}

std::vector<labelq::model::Item> ItemStore::List(const labelq::db::ItemFilter& filter) {
  auto effective_filter   = filter;
  effective_filter.now_ms = labelq::util::ToUnixMillis(now_());

  auto tx      = repository_->Begin();
  auto records = repository_->ListItems(*tx, effective_filter);
  tx->Commit();

  std::vector<labelq::model::Item> items;
  items.reserve(records.size());
  for (const auto& record : records) {
    items.push_back(ToItem(record));
  }
  return items;
}

std::unordered_set<std::string> ItemStore::KnownNames() {
  auto tx    = repository_->Begin();
  auto names = repository_->ListNames(*tx);
  tx->Commit();
  return {names.begin(), names.end()};
}

} // namespace labelq::store
