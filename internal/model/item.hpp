#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "internal/model/state_machine.hpp"

namespace labelq::model {

// category id -> selected label ids
using Labels = std::map<std::string, std::set<std::string>>;

struct Reservation {
  std::string token;
  std::chrono::system_clock::time_point reserved_at{};
  std::chrono::system_clock::time_point expires_at{};
};

/*
  One unit of work (an image).

  labels is non-empty only for Done && !skipped.
  reservation is set only while Reserved.
*/
struct Item {
  std::uint64_t id = 0;
  std::string name;
  ItemState state = ItemState::kPending;
  bool skipped = false;
  Labels labels;
  std::optional<Reservation> reservation;
  std::chrono::system_clock::time_point updated_at{};
};

// True if at least one category has at least one selected label.
inline bool HasSelection(const Labels& labels) {
  for (const auto& [_, values] : labels) {
    if (!values.empty()) return true;
  }
  return false;
}

struct ItemCounts {
  std::uint64_t pending = 0;        // includes expired reservations
  std::uint64_t reserved_live = 0;
  std::uint64_t done = 0;
  std::uint64_t skipped = 0;        // subset of done
  std::uint64_t total = 0;
};

} // namespace labelq::model
