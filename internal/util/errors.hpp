#pragma once

#include <stdexcept>
#include <string>

namespace chunkscribe::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An at-most-once artifact already exists.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised by event sinks only.
  The notifier catches it at its boundary; it never reaches a caller.
*/
class NotificationDeliveryError : public std::runtime_error {
 public:
  explicit NotificationDeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chunkscribe::util
