#pragma once

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::model {

using chunkscribe::core::v1::SessionStatus;
using chunkscribe::core::v1::TranscriptionStatus;

/*
  Session lifecycle:

      OPEN -> RECEIVING -> COMPLETED
        \         \
         +---------+----> FAILED

  COMPLETED and FAILED are terminal.
*/

constexpr bool IsTerminal(SessionStatus status) {
  return status == chunkscribe::core::v1::SESSION_STATUS_COMPLETED || status == chunkscribe::core::v1::SESSION_STATUS_FAILED;
}

constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  using namespace chunkscribe::core::v1;

  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case SESSION_STATUS_RECEIVING:
      return from == SESSION_STATUS_OPEN;
    case SESSION_STATUS_COMPLETED:
      return from == SESSION_STATUS_RECEIVING;
    case SESSION_STATUS_FAILED:
      return true;
    default:
      return false;
  }
}

constexpr bool IsInFlight(TranscriptionStatus status) {
  return status == chunkscribe::core::v1::TRANSCRIPTION_STATUS_PENDING || status == chunkscribe::core::v1::TRANSCRIPTION_STATUS_PROCESSING;
}

constexpr bool IsSettled(TranscriptionStatus status) {
  return status == chunkscribe::core::v1::TRANSCRIPTION_STATUS_COMPLETED || status == chunkscribe::core::v1::TRANSCRIPTION_STATUS_FAILED;
}

} // namespace chunkscribe::model
