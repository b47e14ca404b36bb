#pragma once

#include <stdexcept>
#include <string>

namespace fleet::util {

/*
  Central error types.

  These get translated later to gRPC status codes and HTTP statuses.
  None of them is retried by the core; retry policy belongs to the caller.
*/

// Device is Rejected/Revoked, not Approved where approval is required,
// or reports on an action it does not hold.
class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Action targets a device absent from the registry (or not Approved).
class UnknownDevice : public std::runtime_error {
 public:
  explicit UnknownDevice(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidStateTransition : public std::runtime_error {
 public:
  explicit InvalidStateTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transaction could not commit. Everything it wrote, audit included, is gone.
class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleet::util
