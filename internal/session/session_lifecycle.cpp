#include "session_lifecycle.hpp"

#include <algorithm>

#include "internal/aggregate/aggregator.hpp"
#include "internal/cache/artifact_cache.hpp"
#include "internal/chunk/chunk_store.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/events/event_factory.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chunkscribe::session {

using namespace chunkscribe::core::v1;
using chunkscribe::db::ThrowIfDbError;
using chunkscribe::observability::DoubleField;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

SessionLifecycle::SessionLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<aggregate::Aggregator> aggregator,
                                   std::shared_ptr<events::EventNotifier> notifier, std::shared_ptr<cache::ArtifactCache> cache)
    : repository_(std::move(repository)), aggregator_(std::move(aggregator)), notifier_(std::move(notifier)), cache_(std::move(cache)) {
}

db::model::SessionRecord SessionLifecycle::OpenSession(const std::string& session_id, std::optional<uint32_t> total_chunks_expected) {
  chunk::ValidateSessionId(session_id);
  if (total_chunks_expected && *total_chunks_expected == 0) {
    throw util::ValidationError("total_chunks_expected must be positive");
  }

  db::model::SessionRecord session;
  bool                     total_changed = false;
  {
    auto session_lock = session_locks_.Lock(session_id);

    auto tx       = repository_->Begin();
    auto existing = repository_->GetSession(*tx, session_id);
    if (!existing) {
      const auto now                = util::NowMillis();
      session.session_id            = session_id;
      session.status                = SESSION_STATUS_OPEN;
      session.total_chunks_expected = total_chunks_expected;
      session.created_at_ms         = now;
      session.updated_at_ms         = now;
      ThrowIfDbError(repository_->InsertSession(*tx, session), "open session");
      tx->Commit();

      CHUNKSCRIBE_LOG_INFO("Session opened", {StringField("session_id", session_id)});
      return session;
    }

    session = *existing;
    if (total_chunks_expected && !model::IsTerminal(session.status) && session.total_chunks_expected != total_chunks_expected) {
      session.total_chunks_expected = total_chunks_expected;
      session.updated_at_ms         = util::NowMillis();
      ThrowIfDbError(repository_->UpdateSession(*tx, session), "record total_chunks_expected");
      total_changed = true;
    }
    tx->Commit();
  }

  if (total_changed) {
    if (auto outcome = EvaluateCompletion(session_id)) {
      return outcome->session;
    }
  }
  return session;
}

std::optional<SessionOutcome> SessionLifecycle::EvaluateCompletion(const std::string& session_id) {
  return Settle(session_id, false);
}

SessionOutcome SessionLifecycle::FinalizeSession(const std::string& session_id) {
  auto outcome = Settle(session_id, true);
  if (!outcome) {
    throw std::runtime_error("session " + session_id + " could not be finalized");
  }
  return *outcome;
}

std::optional<SessionOutcome> SessionLifecycle::Settle(const std::string& session_id, bool forced) {
  auto session_lock = session_locks_.Lock(session_id);

  SessionOutcome outcome;
  uint32_t       total_chunks = 0;
  {
    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    if (!session) {
      if (forced) throw util::NotFound("session " + session_id + " not found");
      return std::nullopt;
    }
    if (model::IsTerminal(session->status)) {
      if (forced) throw util::Conflict("session " + session_id + " is already " + SessionStatus_Name(session->status));
      return std::nullopt;
    }

    auto chunks  = repository_->ListChunks(*tx, session_id);
    total_chunks = static_cast<uint32_t>(chunks.size());

    if (!forced) {
      if (!session->total_chunks_expected) return std::nullopt;

      const uint32_t last     = *session->total_chunks_expected - 1;
      const bool     has_last = std::any_of(chunks.begin(), chunks.end(), [&](const auto& c) { return c.sequence_index == last; });
      if (!has_last) return std::nullopt;

      const bool in_flight = std::any_of(chunks.begin(), chunks.end(), [](const auto& c) { return model::IsInFlight(c.transcription_status); });
      if (in_flight) return std::nullopt;
    }

    const bool any_completed =
        std::any_of(chunks.begin(), chunks.end(), [](const auto& c) { return c.transcription_status == TRANSCRIPTION_STATUS_COMPLETED; });

    const auto now         = util::NowMillis();
    session->updated_at_ms = now;

    if (!any_completed) {
      if (!model::CanTransition(session->status, SESSION_STATUS_FAILED)) {
        throw util::InvalidState("session " + session_id + " cannot fail from " + SessionStatus_Name(session->status));
      }
      session->status         = SESSION_STATUS_FAILED;
      session->failure_reason = chunks.empty() ? "no chunks were uploaded" : "no chunk produced a transcript";
      ThrowIfDbError(repository_->UpdateSession(*tx, *session), "fail session");
    } else {
      if (!model::CanTransition(session->status, SESSION_STATUS_COMPLETED)) {
        throw util::InvalidState("session " + session_id + " cannot complete from " + SessionStatus_Name(session->status));
      }
      auto transcript = aggregator_->AggregateChunks(session_id, std::move(chunks));

      session->status = SESSION_STATUS_COMPLETED;
      if (session->completed_at_ms == 0) {
        session->completed_at_ms = now;
      }
      ThrowIfDbError(repository_->UpdateSession(*tx, *session), "complete session");

      db::model::TranscriptRecord record;
      record.session_id    = session_id;
      record.transcript    = transcript;
      record.created_at_ms = now;
      ThrowIfDbError(repository_->InsertTranscript(*tx, record), "store transcript");

      outcome.transcript = std::move(transcript);
    }

    tx->Commit();
    outcome.session = *session;
  }

  Announce(outcome, total_chunks);
  return outcome;
}

void SessionLifecycle::Announce(const SessionOutcome& outcome, uint32_t total_chunks) {
  const auto& session = outcome.session;

  if (session.status == SESSION_STATUS_COMPLETED) {
    CHUNKSCRIBE_LOG_INFO("Session completed", {StringField("session_id", session.session_id), IntField("total_chunks", total_chunks),
                                               IntField("completed_chunks", outcome.transcript->completed_chunks()),
                                               DoubleField("confidence", outcome.transcript->confidence_score())});
    if (notifier_) {
      notifier_->Publish(events::MakeSessionCompleted(*outcome.transcript));
    }
    if (cache_) {
      cache_->NoteWorkCompleted();
    }
    return;
  }

  CHUNKSCRIBE_LOG_WARN("Session failed", {StringField("session_id", session.session_id), IntField("total_chunks", total_chunks),
                                          StringField("reason", session.failure_reason)});
  if (notifier_) {
    notifier_->Publish(events::MakeSessionFailed(session.session_id, session.failure_reason, total_chunks));
  }
}

std::optional<db::model::SessionRecord> SessionLifecycle::GetSession(const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = repository_->GetSession(*tx, session_id);
  tx->Commit();
  return session;
}

SessionTranscript SessionLifecycle::GetTranscript(const std::string& session_id) {
  SessionTranscript                   result;
  std::vector<db::model::ChunkRecord> chunks;
  {
    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    if (!session) {
      throw util::NotFound("session " + session_id + " not found");
    }
    result.status = session->status;

    if (session->status == SESSION_STATUS_COMPLETED) {
      if (auto stored = repository_->GetTranscript(*tx, session_id)) {
        tx->Commit();
        result.transcript = std::move(stored->transcript);
        return result;
      }
    }
    chunks = repository_->ListChunks(*tx, session_id);
    tx->Commit();
  }

  result.transcript = aggregator_->AggregateChunks(session_id, std::move(chunks));
  return result;
}

// ------------------------------------------------------------------
// Descriptors
// ------------------------------------------------------------------

SessionDescriptor ToDescriptor(const db::model::SessionRecord& session) {
  SessionDescriptor out;
  out.set_session_id(session.session_id);
  out.set_status(session.status);
  if (session.total_chunks_expected) {
    out.set_total_chunks_expected(*session.total_chunks_expected);
  }
  out.set_total_duration_seconds(session.total_duration_seconds);
  out.set_created_at_ms(session.created_at_ms);
  out.set_updated_at_ms(session.updated_at_ms);
  out.set_completed_at_ms(session.completed_at_ms);
  out.set_failure_reason(session.failure_reason);
  return out;
}

ChunkDescriptor ToDescriptor(const db::model::ChunkRecord& chunk) {
  ChunkDescriptor out;
  out.set_session_id(chunk.session_id);
  out.set_sequence_index(chunk.sequence_index);
  out.set_chunk_id(chunk.chunk_id);
  out.set_file_extension(chunk.file_extension);
  out.set_size_bytes(chunk.size_bytes);
  out.set_overlap_seconds(chunk.overlap_seconds);
  out.set_question_id(chunk.question_id);
  out.set_upload_status(chunk.upload_status);
  out.set_transcription_status(chunk.transcription_status);
  if (chunk.transcript_text) {
    out.set_transcript_text(*chunk.transcript_text);
  }
  for (const auto& segment : chunk.segments) {
    *out.add_segments() = segment;
  }
  out.set_confidence_score(chunk.confidence_score);
  out.set_duration_seconds(chunk.duration_seconds);
  out.set_language(chunk.language);
  out.set_attempts(chunk.attempts);
  out.set_last_error(chunk.last_error);
  out.set_created_at_ms(chunk.created_at_ms);
  out.set_updated_at_ms(chunk.updated_at_ms);
  return out;
}

} // namespace chunkscribe::session
