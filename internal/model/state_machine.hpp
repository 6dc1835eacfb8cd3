#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace labelq::model {

enum class ItemState : std::uint8_t {
  kPending  = 0,
  kReserved = 1,
  kDone     = 2,
};

constexpr bool IsTerminal(ItemState state) {
  return state == ItemState::kDone;
}

// Reserved -> Reserved is the re-issue of an expired reservation.
constexpr bool CanTransition(ItemState from, ItemState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case ItemState::kPending:
      return to == ItemState::kReserved;
    case ItemState::kReserved:
      return true;
    case ItemState::kDone:
    default:
      return false;
  }
}

constexpr std::string_view ToString(ItemState state) {
  switch (state) {
    case ItemState::kPending:
      return "pending";
    case ItemState::kReserved:
      return "reserved";
    case ItemState::kDone:
      return "done";
  }
  return "pending";
}

constexpr std::optional<ItemState> ParseItemState(std::string_view value) {
  if (value == "pending") return ItemState::kPending;
  if (value == "reserved") return ItemState::kReserved;
  if (value == "done") return ItemState::kDone;
  return std::nullopt;
}

} // namespace labelq::model
