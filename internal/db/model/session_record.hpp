#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::db::model {

/*
  Persistent session row.

  completed_at_ms is written once, in the same transaction that moves
  status to COMPLETED. 0 means unset.
*/
struct SessionRecord {
  std::string session_id;

  chunkscribe::core::v1::SessionStatus status = chunkscribe::core::v1::SESSION_STATUS_OPEN;

  std::optional<uint32_t> total_chunks_expected;

  double total_duration_seconds = 0.0;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  std::string failure_reason;
};

} // namespace chunkscribe::db::model
