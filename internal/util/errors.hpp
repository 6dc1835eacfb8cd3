#pragma once

#include <stdexcept>
#include <string>

namespace labelq::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller input violates a precondition. No state was changed.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The presented token is not the item's live reservation.

  Reason is for diagnostics only; callers treat every reason the same way
  (drop the assignment, ask for a new item).
*/
class ReservationInvalid : public std::runtime_error {
 public:
  enum class Reason {
    kNoSuchItem,
    kNotReserved,
    kAlreadyDone,
    kTokenMismatch,
    kExpired,
  };

  ReservationInvalid(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

 private:
  Reason reason_;
};

// Backend could not take the lock in time; safe to retry.
class StoreBusy : public std::runtime_error {
 public:
  explicit StoreBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

const char* ToString(ReservationInvalid::Reason reason);

} // namespace labelq::util
