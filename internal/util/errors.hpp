#pragma once

#include <stdexcept>
#include <string>

namespace songqueue::util {

/*
  Central error types.

  Every failure of the queue core is one of these. They get translated
  later to gRPC status codes (internal/grpc/grpc_error.cpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class LimitScope {
  kPatron,
  kQueue,
};

inline const char* ToString(LimitScope scope) {
  return scope == LimitScope::kPatron ? "patron" : "queue";
}

class LimitExceeded : public std::runtime_error {
 public:
  LimitExceeded(LimitScope scope, const std::string& msg) : std::runtime_error(msg), scope_(scope) {
  }

  LimitScope Scope() const {
    return scope_;
  }

 private:
  LimitScope scope_;
};

class Duplicate : public std::runtime_error {
 public:
  explicit Duplicate(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable store unavailable or failed; the operation did not commit.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace songqueue::util
