#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace flowstead::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Raises the error type matching a failed result.

  Conflict, Busy and SerializationFailure mean "someone else wrote first"
  and surface as TransactionConflict so callers can retry the unit of work.
*/
inline void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  const auto message = prefix + (result.message.empty() ? "" : ": " + result.message);
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace flowstead::db
