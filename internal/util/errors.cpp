#include "errors.hpp"

namespace labelq::util {

const char* ToString(ReservationInvalid::Reason reason) {
  switch (reason) {
    case ReservationInvalid::Reason::kNoSuchItem:
      return "no_such_item";
    case ReservationInvalid::Reason::kNotReserved:
      return "not_reserved";
    case ReservationInvalid::Reason::kAlreadyDone:
      return "already_done";
    case ReservationInvalid::Reason::kTokenMismatch:
      return "token_mismatch";
    case ReservationInvalid::Reason::kExpired:
      return "expired";
  }
  return "unknown";
}

} // namespace labelq::util
