#include "event_factory.hpp"

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chunkscribe::events {

using chunkscribe::events::v1::Event;

namespace {

Event NewEvent() {
  Event event;
  event.set_event_id(util::NewId());
  event.set_emitted_at_ms(util::NowMillis());
  return event;
}

} // namespace

Event MakeChunkUploaded(const db::model::ChunkRecord& chunk, bool overwrote_existing) {
  auto  event = NewEvent();
  auto* body  = event.mutable_chunk_uploaded();
  body->set_session_id(chunk.session_id);
  body->set_sequence_index(chunk.sequence_index);
  body->set_chunk_id(chunk.chunk_id);
  body->set_question_id(chunk.question_id);
  body->set_size_bytes(chunk.size_bytes);
  body->set_overwrote_existing(overwrote_existing);
  return event;
}

Event MakeSessionCompleted(const chunkscribe::core::v1::AggregatedTranscript& transcript) {
  auto  event = NewEvent();
  auto* body  = event.mutable_session_completed();
  body->set_session_id(transcript.session_id());
  *body->mutable_transcript() = transcript;
  return event;
}

Event MakeSessionFailed(const std::string& session_id, const std::string& reason, uint32_t total_chunks) {
  auto  event = NewEvent();
  auto* body  = event.mutable_session_failed();
  body->set_session_id(session_id);
  body->set_reason(reason);
  body->set_total_chunks(total_chunks);
  return event;
}

std::string EventType(const Event& event) {
  switch (event.body_case()) {
    case Event::kChunkUploaded:
      return "chunk_uploaded";
    case Event::kSessionCompleted:
      return "session_completed";
    case Event::kSessionFailed:
      return "session_failed";
    case Event::BODY_NOT_SET:
      break;
  }
  return "unknown";
}

} // namespace chunkscribe::events
