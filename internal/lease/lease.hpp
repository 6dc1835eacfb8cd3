#pragma once

#include <chrono>
#include <string>

#include "internal/model/item.hpp"

namespace labelq::lease {

struct Lease {
  labelq::model::Item item;
  std::string         token;

  std::chrono::system_clock::time_point expires_at;
};

}
