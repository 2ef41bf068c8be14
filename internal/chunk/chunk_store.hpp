#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace chunkscribe::transcription {
class TranscriptionScheduler;
}
namespace chunkscribe::events {
class EventNotifier;
}

namespace chunkscribe::chunk {

struct IngestLimits {
  uint64_t                        max_blob_bytes = 0;
  std::unordered_set<std::string> allowed_extensions;
  double                          default_overlap_seconds = 0.0;

  static IngestLimits FromConfig(const chunkscribe::runtime::config::IngestConfig& config);
};

struct UploadRequest {
  std::string session_id;
  uint32_t    sequence_index = 0;

  // Only the extension is used; it must be in the allow-list.
  std::string                    file_name;
  std::shared_ptr<arrow::Buffer> blob;

  std::optional<double>   overlap_seconds;
  std::optional<uint32_t> total_chunks_expected;
  std::optional<double>   duration_seconds;
  std::string             question_id;
};

struct ChunkRef {
  std::string                         session_id;
  uint32_t                            sequence_index = 0;
  std::string                         chunk_id;
  chunkscribe::core::v1::UploadStatus upload_status = chunkscribe::core::v1::UPLOAD_STATUS_UNSPECIFIED;
  bool                                overwrote_existing = false;
  std::string                         message;
};

/*
  Chunk Store.

  Durable record of every uploaded chunk: metadata row in the repository,
  audio bytes in the blob store.

  Write ordering for an upsert of (session_id, sequence_index):
    1. validate (nothing is written on failure)
    2. write the new blob under a fresh key
    3. one transaction: session upsert + chunk upsert + duration recompute
    4. delete the previous blob, if any

  A reader therefore never sees a row whose blob is gone, and an index is
  never left without a valid blob. Uploads to one session are serialized.
*/
class ChunkStore {
 public:
  ChunkStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, IngestLimits limits,
             std::shared_ptr<transcription::TranscriptionScheduler> scheduler = nullptr,
             std::shared_ptr<events::EventNotifier>                 notifier  = nullptr);

  ChunkRef UpsertChunk(const UploadRequest& request);

  std::optional<db::model::ChunkRecord> GetChunk(const std::string& session_id, uint32_t sequence_index);
  std::vector<db::model::ChunkRecord>   ListChunks(const std::string& session_id);

  std::shared_ptr<arrow::Buffer> ReadBlob(const db::model::ChunkRecord& chunk);

  const IngestLimits& Limits() const {
    return limits_;
  }

  size_t LockedSessionCount() const {
    return session_locks_.Size();
  }

 private:
  void Validate(const UploadRequest& request, std::string* extension) const;

  std::shared_ptr<db::Repository>                        repository_;
  storage::StorageBackendPtr                             blobs_;
  IngestLimits                                           limits_;
  std::shared_ptr<transcription::TranscriptionScheduler> scheduler_;
  std::shared_ptr<events::EventNotifier>                 notifier_;

  util::KeyedMutex session_locks_;
};

// ------------------------------------------------------------------
// Helpers shared with the worker pool and retention
// ------------------------------------------------------------------

// Throws util::ValidationError unless session_id is usable as a blob namespace.
void ValidateSessionId(const std::string& session_id);

// Lower-cased text after the last '.', empty if there is none.
std::string ExtensionOf(const std::string& file_name);

// "sessions/<session_id>/chunk_0003_<chunk_id>.webm"
std::string ChunkBlobKey(const std::string& session_id, uint32_t sequence_index, const std::string& chunk_id, const std::string& extension);

double SumDurations(const std::vector<db::model::ChunkRecord>& chunks);

} // namespace chunkscribe::chunk
