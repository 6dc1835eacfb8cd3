#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace labelq::db::memory {

using labelq::model::ItemState;

namespace {

bool IsEligible(const model::ItemRecord& r, uint64_t now_ms) {
  return r.state == ItemState::kPending || (r.state == ItemState::kReserved && r.expires_at_ms <= now_ms);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertItemIfAbsent(Transaction& t, const std::string& name, uint64_t now_ms) {
  auto& s = TX(t).Mutable();
  if (s.ids_by_name.contains(name)) return Result::Ok();

  model::ItemRecord r;
  r.id            = s.next_item_id++;
  r.name          = name;
  r.state         = ItemState::kPending;
  r.updated_at_ms = now_ms;

  s.ids_by_name[name] = r.id;
  s.items[r.id]       = std::move(r);
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ItemRecord> MemoryRepository::GetItemByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.ids_by_name.find(name);
  if (it == s.ids_by_name.end()) return std::nullopt;
  return GetItem(t, it->second);
}

std::optional<model::ItemRecord> MemoryRepository::FindNextEligible(Transaction& t, uint64_t now_ms) {
  for (const auto& [_, record] : TX(t).View().items) {
    if (IsEligible(record, now_ms)) return record;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.items.find(r.id);
  if (it == s.items.end()) return Result::Err(ErrorCode::NotFound, "item " + std::to_string(r.id));
  if (it->second.name != r.name) return Result::Err(ErrorCode::ConstraintViolation, "item name is immutable");
  it->second = r;
  return Result::Ok();
}

std::vector<model::ItemRecord> MemoryRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  std::vector<model::ItemRecord> out;
  std::size_t                    skipped = 0;
  for (const auto& [_, record] : TX(t).View().items) {
    if (filter.state) {
      const auto effective = IsEligible(record, filter.now_ms) ? ItemState::kPending : record.state;
      if (effective != *filter.state) continue;
    }
    if (skipped < filter.page.offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= filter.page.limit) break;
    out.push_back(record);
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListNames(Transaction& t) {
  const auto&              s = TX(t).View();
  std::vector<std::string> names;
  names.reserve(s.ids_by_name.size());
  for (const auto& [name, _] : s.ids_by_name) {
    names.push_back(name);
  }
  return names;
}

labelq::model::ItemCounts MemoryRepository::CountItems(Transaction& t, uint64_t now_ms) {
  labelq::model::ItemCounts counts;
  for (const auto& [_, record] : TX(t).View().items) {
    ++counts.total;
    if (IsEligible(record, now_ms)) {
      ++counts.pending;
    } else if (record.state == ItemState::kReserved) {
      ++counts.reserved_live;
    } else if (record.state == ItemState::kDone) {
      ++counts.done;
      if (record.skipped) ++counts.skipped;
    }
  }
  return counts;
}

Result MemoryRepository::ReleaseAllReservations(Transaction& t, uint64_t now_ms, uint64_t* released) {
  uint64_t changed = 0;
  for (auto& [_, record] : TX(t).Mutable().items) {
    if (record.state != ItemState::kReserved) continue;
    record.state = ItemState::kPending;
    record.reservation_token.clear();
    record.reserved_at_ms = 0;
    record.expires_at_ms  = 0;
    record.updated_at_ms  = now_ms;
    ++changed;
  }
  if (released) *released = changed;
  return Result::Ok();
}

} // namespace labelq::db::memory
