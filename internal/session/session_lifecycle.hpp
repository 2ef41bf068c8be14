#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chunkscribe/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace chunkscribe::aggregate {
class Aggregator;
}
namespace chunkscribe::cache {
class ArtifactCache;
}
namespace chunkscribe::events {
class EventNotifier;
}

namespace chunkscribe::session {

struct SessionOutcome {
  db::model::SessionRecord                                  session;
  std::optional<chunkscribe::core::v1::AggregatedTranscript> transcript;
};

struct SessionTranscript {
  chunkscribe::core::v1::SessionStatus        status = chunkscribe::core::v1::SESSION_STATUS_UNSPECIFIED;
  chunkscribe::core::v1::AggregatedTranscript transcript;
};

/*
  Session state transitions.

      OPEN -> RECEIVING -> COMPLETED | FAILED

  Evaluation is serialized per session and reads, decides and writes in
  one transaction, so at most one terminal transition (and one event)
  happens per session.
*/
class SessionLifecycle {
 public:
  SessionLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<aggregate::Aggregator> aggregator,
                   std::shared_ptr<events::EventNotifier> notifier = nullptr, std::shared_ptr<cache::ArtifactCache> cache = nullptr);

  // Creates the session as OPEN, or returns the existing one. A supplied
  // total is recorded on non-terminal sessions.
  db::model::SessionRecord OpenSession(const std::string& session_id, std::optional<uint32_t> total_chunks_expected);

  /*
    Completes the session if total_chunks_expected is known, the final
    chunk is stored and no chunk is pending or processing. Sessions
    without a single transcribed chunk fail instead.
    Returns the outcome when this call made the transition.
  */
  std::optional<SessionOutcome> EvaluateCompletion(const std::string& session_id);

  // Settles the session now regardless of missing or in-flight chunks.
  // NotFound for unknown sessions, Conflict for terminal ones.
  SessionOutcome FinalizeSession(const std::string& session_id);

  std::optional<db::model::SessionRecord> GetSession(const std::string& session_id);

  // Persisted transcript for COMPLETED sessions, otherwise the live aggregate.
  SessionTranscript GetTranscript(const std::string& session_id);

  size_t LockedSessionCount() const {
    return session_locks_.Size();
  }

 private:
  std::optional<SessionOutcome> Settle(const std::string& session_id, bool forced);

  void Announce(const SessionOutcome& outcome, uint32_t total_chunks);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<aggregate::Aggregator> aggregator_;
  std::shared_ptr<events::EventNotifier> notifier_;
  std::shared_ptr<cache::ArtifactCache>  cache_;

  util::KeyedMutex session_locks_;
};

chunkscribe::core::v1::SessionDescriptor ToDescriptor(const db::model::SessionRecord& session);

chunkscribe::core::v1::ChunkDescriptor ToDescriptor(const db::model::ChunkRecord& chunk);

} // namespace chunkscribe::session
