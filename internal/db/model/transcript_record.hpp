#pragma once

#include <cstdint>
#include <string>

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::db::model {

// Aggregation result persisted at session completion. At most one per session.
struct TranscriptRecord {
  std::string                                session_id;
  chunkscribe::core::v1::AggregatedTranscript transcript;
  uint64_t                                   created_at_ms = 0;
};

} // namespace chunkscribe::db::model
