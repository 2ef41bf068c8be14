#pragma once

#include <string>

#include "chunkscribe/events/v1/events.pb.h"
#include "internal/db/model/chunk_record.hpp"

namespace chunkscribe::events {

chunkscribe::events::v1::Event MakeChunkUploaded(const db::model::ChunkRecord& chunk, bool overwrote_existing);

chunkscribe::events::v1::Event MakeSessionCompleted(const chunkscribe::core::v1::AggregatedTranscript& transcript);

chunkscribe::events::v1::Event MakeSessionFailed(const std::string& session_id, const std::string& reason, uint32_t total_chunks);

// "chunk_uploaded", "session_completed", "session_failed"
std::string EventType(const chunkscribe::events::v1::Event& event);

} // namespace chunkscribe::events
