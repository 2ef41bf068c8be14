#pragma once

#include <string>
#include <string_view>

namespace chunkscribe::db {

/*
  Outcome of a repository call.

  Both backends report the same codes for the same situation:
    NotFound             update/delete of a row that does not exist
    AlreadyExists        second transcript for a session, duplicate session id
    ConstraintViolation  chunk or cache row referencing a missing session
    Busy                 sqlite lock contention past the busy timeout
  Callers outside db/ convert with ThrowIfDbError() and never see
  sqlite result codes.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

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

  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out += ": " + message;
    }
    return out;
  }
};

} // namespace chunkscribe::db
