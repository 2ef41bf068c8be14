#include "log_sink.hpp"

#include "event_factory.hpp"
#include "internal/observability/logging.hpp"

namespace chunkscribe::events {

using chunkscribe::observability::DoubleField;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

void LogSink::Deliver(const chunkscribe::events::v1::Event& event) {
  switch (event.body_case()) {
    case v1::Event::kChunkUploaded: {
      const auto& body = event.chunk_uploaded();
      CHUNKSCRIBE_LOG_INFO("event", {StringField("type", EventType(event)), StringField("session_id", body.session_id()),
                                     IntField("sequence_index", body.sequence_index()), StringField("chunk_id", body.chunk_id())});
      break;
    }
    case v1::Event::kSessionCompleted: {
      const auto& transcript = event.session_completed().transcript();
      CHUNKSCRIBE_LOG_INFO("event", {StringField("type", EventType(event)), StringField("session_id", transcript.session_id()),
                                     IntField("total_chunks", transcript.total_chunks()),
                                     DoubleField("confidence", transcript.confidence_score()),
                                     IntField("transcript_chars", static_cast<int64_t>(transcript.full_transcript().size()))});
      break;
    }
    case v1::Event::kSessionFailed: {
      const auto& body = event.session_failed();
      CHUNKSCRIBE_LOG_WARN("event", {StringField("type", EventType(event)), StringField("session_id", body.session_id()),
                                     StringField("reason", body.reason())});
      break;
    }
    case v1::Event::BODY_NOT_SET:
      break;
  }
}

} // namespace chunkscribe::events
