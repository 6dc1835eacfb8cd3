#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace labelq::util {

/*
  UUID helpers

  Random (version 4) UUIDs, used as the unguessable part of reservation
  tokens.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Lower-case, dashed 8-4-4-4-12 form.
std::string ToString(const UUID& id);

} // namespace labelq::util
