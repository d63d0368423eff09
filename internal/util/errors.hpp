#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "flowstead/core/v1/types.pb.h"

namespace flowstead::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage reported a concurrent modification; the whole unit of work is retried.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Engine-level failures. Never surfaced to workflow code.
*/

// RunLock expired or the history append conflicted mid-decision.
class LeaseLostError : public LeaseConflict {
 public:
  explicit LeaseLostError(const std::string& msg) : LeaseConflict(msg) {
  }
};

// Replay produced a decision that contradicts recorded history.
class NonDeterminismError : public std::runtime_error {
 public:
  explicit NonDeterminismError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Errors raised by activity implementations. The worker classifies them:
  anything other than NonRetryableActivityError is reported retryable.
*/

class TransientActivityError : public std::runtime_error {
 public:
  explicit TransientActivityError(const std::string& msg, std::string type = "TransientActivityError")
      : std::runtime_error(msg), type_(std::move(type)) {
  }

  const std::string& Type() const {
    return type_;
  }

 private:
  std::string type_;
};

class NonRetryableActivityError : public std::runtime_error {
 public:
  explicit NonRetryableActivityError(const std::string& msg, std::string type = "NonRetryableActivityError")
      : std::runtime_error(msg), type_(std::move(type)) {
  }

  const std::string& Type() const {
    return type_;
  }

 private:
  std::string type_;
};

/*
  Errors handed to workflow code. They carry the recorded Failure so a
  workflow can inspect, handle or propagate it.
*/

class ActivityFailure : public std::runtime_error {
 public:
  explicit ActivityFailure(flowstead::core::v1::Failure failure)
      : std::runtime_error(failure.message()), failure_(std::move(failure)) {
  }

  const flowstead::core::v1::Failure& Failure() const {
    return failure_;
  }

 private:
  flowstead::core::v1::Failure failure_;
};

class ActivityTimeoutError : public ActivityFailure {
 public:
  explicit ActivityTimeoutError(flowstead::core::v1::Failure failure) : ActivityFailure(std::move(failure)) {
  }
};

class ChildWorkflowFailure : public std::runtime_error {
 public:
  ChildWorkflowFailure(std::size_t index, flowstead::core::v1::Failure failure)
      : std::runtime_error("child workflow " + std::to_string(index) + " failed: " + failure.message()),
        index_(index),
        failure_(std::move(failure)) {
  }

  std::size_t Index() const {
    return index_;
  }

  const flowstead::core::v1::Failure& Failure() const {
    return failure_;
  }

 private:
  std::size_t                  index_;
  flowstead::core::v1::Failure failure_;
};

// Workflow code explicitly failed; becomes the terminal result of the run.
class WorkflowExecutionError : public std::runtime_error {
 public:
  explicit WorkflowExecutionError(const std::string& msg, std::string type = "WorkflowExecutionError")
      : std::runtime_error(msg), type_(std::move(type)) {
  }

  const std::string& Type() const {
    return type_;
  }

 private:
  std::string type_;
};

} // namespace flowstead::util
