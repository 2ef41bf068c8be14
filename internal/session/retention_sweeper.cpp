#include "retention_sweeper.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"

namespace chunkscribe::session {

using chunkscribe::db::ThrowIfDbError;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

RetentionSweeper::RetentionSweeper(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, uint64_t max_age_ms)
    : repository_(std::move(repository)), blobs_(std::move(blobs)), max_age_ms_(max_age_ms) {
}

RetentionReport RetentionSweeper::Sweep(uint64_t now_ms) {
  RetentionReport          report;
  std::vector<std::string> blob_keys;

  {
    auto tx = repository_->Begin();
    for (const auto& session : repository_->ListSessions(*tx)) {
      if (!model::IsTerminal(session.status)) continue;

      const uint64_t last_change = std::max(session.updated_at_ms, session.completed_at_ms);
      if (now_ms <= last_change || now_ms - last_change <= max_age_ms_) continue;

      for (const auto& chunk : repository_->ListChunks(*tx, session.session_id)) {
        blob_keys.push_back(chunk.blob_key);
        ++report.chunks_removed;
      }
      ThrowIfDbError(repository_->DeleteSession(*tx, session.session_id), "delete expired session");
      ++report.sessions_removed;
    }
    tx->Commit();
  }

  for (const auto& key : blob_keys) {
    try {
      blobs_->Remove(key);
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_WARN("Failed to remove expired chunk blob", {StringField("blob_key", key), StringField("error", e.what())});
    }
  }

  if (report.sessions_removed > 0) {
    CHUNKSCRIBE_LOG_INFO("Retention sweep", {IntField("sessions_removed", static_cast<int64_t>(report.sessions_removed)),
                                             IntField("chunks_removed", static_cast<int64_t>(report.chunks_removed))});
  }
  return report;
}

} // namespace chunkscribe::session
