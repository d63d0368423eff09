#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace flowstead::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Inverse of ToStatus for clients: rethrows a failed status as the
// matching util:: exception. OK is a no-op.
void ThrowIfFailed(const ::grpc::Status& status);

} // namespace flowstead::grpc
