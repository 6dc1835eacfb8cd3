#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace labelq::db::model {

/*
  Persistent item row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Reservation columns (token, reserved_at_ms, expires_at_ms) are only
    populated while state == Reserved; every transition out of Reserved
    clears them.
  - labels_json is empty unless state == Done && !skipped.
*/

struct ItemRecord {
  uint64_t id = 0; // assigned by the backend on insert

  std::string name;

  labelq::model::ItemState state = labelq::model::ItemState::kPending;

  std::string labels_json;

  bool skipped = false;

  std::string reservation_token;
  uint64_t    reserved_at_ms = 0;
  uint64_t    expires_at_ms  = 0;

  uint64_t updated_at_ms = 0;
};

} // namespace labelq::db::model
