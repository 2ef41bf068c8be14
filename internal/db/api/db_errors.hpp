#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace chunkscribe::db {

// Maps a repository Result onto the service error types.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw chunkscribe::util::Conflict(message);
    case ErrorCode::NotFound:
      throw chunkscribe::util::NotFound(message);
    case ErrorCode::Conflict:
      throw chunkscribe::util::InvalidState(message);
    case ErrorCode::Busy:
      throw chunkscribe::util::ResourceExhausted(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace chunkscribe::db
