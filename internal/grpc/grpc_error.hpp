#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace labelq::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  ReservationInvalid maps to ABORTED whatever its reason: the client's
  only recovery is to drop the item and call Next again.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace labelq::grpc
