#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "internal/model/state_machine.hpp"

namespace labelq::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

// state matches the effective state at now_ms: a reservation whose
// deadline has passed counts as pending, like in CountItems.
struct ItemFilter {
  std::optional<labelq::model::ItemState> state;
  Pagination                              page;
  std::uint64_t                           now_ms = 0;
};

} // namespace labelq::db
