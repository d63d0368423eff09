#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace flowstead::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace flowstead::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const LeaseConflict*>(&e) || dynamic_cast<const TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfFailed(const ::grpc::Status& status) {
  using namespace flowstead::util;

  const auto& message = status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::OK:
      return;
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw AlreadyExists(message);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw InvalidState(message);
    case ::grpc::StatusCode::ABORTED:
      throw LeaseConflict(message);
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw DeadlineExceeded(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw std::invalid_argument(message);
    default:
      throw std::runtime_error("rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " + message);
  }
}

} // namespace flowstead::grpc
