#include "chunk_store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

#include "internal/db/api/db_errors.hpp"
#include "internal/events/event_factory.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transcription/transcription_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chunkscribe::chunk {

using namespace chunkscribe::core::v1;
using chunkscribe::db::ThrowIfDbError;
using chunkscribe::observability::BoolField;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

namespace {

constexpr size_t kMaxSessionIdLength = 128;

} // namespace

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

IngestLimits IngestLimits::FromConfig(const chunkscribe::runtime::config::IngestConfig& config) {
  IngestLimits limits;
  limits.max_blob_bytes          = config.max_blob_bytes();
  limits.default_overlap_seconds = config.default_overlap_seconds();
  for (const auto& ext : config.allowed_extensions()) {
    limits.allowed_extensions.insert(ExtensionOf("." + ext));
  }
  return limits;
}

void ValidateSessionId(const std::string& session_id) {
  if (session_id.empty()) {
    throw util::ValidationError("session_id must not be empty");
  }
  if (session_id.size() > kMaxSessionIdLength) {
    throw util::ValidationError("session_id longer than " + std::to_string(kMaxSessionIdLength) + " characters");
  }
  if (session_id == "." || session_id == "..") {
    throw util::ValidationError("session_id must not be a relative path component");
  }
  for (unsigned char c : session_id) {
    if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') {
      throw util::ValidationError("session_id may only contain letters, digits, '-', '_' and '.'");
    }
  }
}

std::string ExtensionOf(const std::string& file_name) {
  const auto dot = file_name.find_last_of('.');
  if (dot == std::string::npos || dot + 1 == file_name.size()) {
    return {};
  }
  std::string ext = file_name.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string ChunkBlobKey(const std::string& session_id, uint32_t sequence_index, const std::string& chunk_id, const std::string& extension) {
  char index[16];
  std::snprintf(index, sizeof(index), "%04u", sequence_index);
  return "sessions/" + session_id + "/chunk_" + index + "_" + chunk_id + "." + extension;
}

double SumDurations(const std::vector<db::model::ChunkRecord>& chunks) {
  double total = 0.0;
  for (const auto& chunk : chunks) total += chunk.duration_seconds;
  return total;
}

// ------------------------------------------------------------------
// ChunkStore
// ------------------------------------------------------------------

ChunkStore::ChunkStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, IngestLimits limits,
                       std::shared_ptr<transcription::TranscriptionScheduler> scheduler, std::shared_ptr<events::EventNotifier> notifier)
    : repository_(std::move(repository)),
      blobs_(std::move(blobs)),
      limits_(std::move(limits)),
      scheduler_(std::move(scheduler)),
      notifier_(std::move(notifier)) {
}

void ChunkStore::Validate(const UploadRequest& request, std::string* extension) const {
  ValidateSessionId(request.session_id);

  if (!request.blob || request.blob->size() == 0) {
    throw util::ValidationError("audio blob must not be empty");
  }
  if (static_cast<uint64_t>(request.blob->size()) > limits_.max_blob_bytes) {
    throw util::ValidationError("audio blob of " + std::to_string(request.blob->size()) + " bytes exceeds limit of " +
                                std::to_string(limits_.max_blob_bytes) + " bytes");
  }

  *extension = ExtensionOf(request.file_name);
  if (extension->empty()) {
    throw util::ValidationError("file name '" + request.file_name + "' has no extension");
  }
  if (!limits_.allowed_extensions.contains(*extension)) {
    throw util::ValidationError("file type '." + *extension + "' is not allowed");
  }

  if (request.overlap_seconds && (!std::isfinite(*request.overlap_seconds) || *request.overlap_seconds < 0.0)) {
    throw util::ValidationError("overlap_seconds must be a non-negative number");
  }
  if (request.total_chunks_expected && *request.total_chunks_expected == 0) {
    throw util::ValidationError("total_chunks_expected must be positive");
  }
  if (request.duration_seconds && (!std::isfinite(*request.duration_seconds) || *request.duration_seconds < 0.0)) {
    throw util::ValidationError("duration_seconds must be a non-negative number");
  }
}

ChunkRef ChunkStore::UpsertChunk(const UploadRequest& request) {
  std::string extension;
  Validate(request, &extension);

  auto session_lock = session_locks_.Lock(request.session_id);

  // ------------------------------------------------------------------
  // Checks against stored state (no writes yet)
  // ------------------------------------------------------------------
  {
    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, request.session_id);
    if (session && model::IsTerminal(session->status)) {
      throw util::InvalidState("session " + request.session_id + " is " + SessionStatus_Name(session->status) + "; uploads are closed");
    }
    tx->Rollback();
  }

  // ------------------------------------------------------------------
  // Blob first
  // ------------------------------------------------------------------
  const auto             now = util::NowMillis();
  db::model::ChunkRecord chunk;
  chunk.session_id           = request.session_id;
  chunk.sequence_index       = request.sequence_index;
  chunk.chunk_id             = util::NewId();
  chunk.file_extension       = extension;
  chunk.blob_key             = ChunkBlobKey(chunk.session_id, chunk.sequence_index, chunk.chunk_id, extension);
  chunk.size_bytes           = static_cast<uint64_t>(request.blob->size());
  chunk.overlap_seconds      = request.overlap_seconds.value_or(limits_.default_overlap_seconds);
  chunk.question_id          = request.question_id;
  chunk.duration_seconds     = request.duration_seconds.value_or(0.0);
  chunk.upload_status        = UPLOAD_STATUS_UPLOADED;
  chunk.transcription_status = TRANSCRIPTION_STATUS_PENDING;
  chunk.created_at_ms        = now;
  chunk.updated_at_ms        = now;

  blobs_->Write(chunk.blob_key, request.blob);

  // ------------------------------------------------------------------
  // Metadata
  // ------------------------------------------------------------------
  std::optional<db::model::ChunkRecord> previous;
  try {
    auto tx = repository_->Begin();

    auto session = repository_->GetSession(*tx, request.session_id);
    if (!session) {
      db::model::SessionRecord created;
      created.session_id    = request.session_id;
      created.status        = SESSION_STATUS_RECEIVING;
      created.created_at_ms = now;
      created.updated_at_ms = now;
      created.total_chunks_expected = request.total_chunks_expected;
      ThrowIfDbError(repository_->InsertSession(*tx, created), "create session");
      session = created;
    } else if (model::IsTerminal(session->status)) {
      // completed while this upload was writing its blob
      throw util::InvalidState("session " + request.session_id + " is " + SessionStatus_Name(session->status) + "; uploads are closed");
    }

    previous = repository_->GetChunk(*tx, request.session_id, request.sequence_index);
    ThrowIfDbError(repository_->UpsertChunk(*tx, chunk), "upsert chunk");

    if (session->status == SESSION_STATUS_OPEN) {
      session->status = SESSION_STATUS_RECEIVING;
    }
    if (request.total_chunks_expected) {
      session->total_chunks_expected = request.total_chunks_expected;
    }
    session->total_duration_seconds = SumDurations(repository_->ListChunks(*tx, request.session_id));
    session->updated_at_ms          = now;
    ThrowIfDbError(repository_->UpdateSession(*tx, *session), "update session");

    tx->Commit();
  } catch (...) {
    blobs_->Remove(chunk.blob_key);
    throw;
  }

  // ------------------------------------------------------------------
  // Old blob is only removed once the new row is durable
  // ------------------------------------------------------------------
  if (previous && previous->blob_key != chunk.blob_key) {
    try {
      blobs_->Remove(previous->blob_key);
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_WARN("Failed to remove replaced chunk blob",
                           {StringField("blob_key", previous->blob_key), StringField("error", e.what())});
    }
  }

  CHUNKSCRIBE_LOG_INFO("Chunk stored", {StringField("session_id", chunk.session_id), IntField("sequence_index", chunk.sequence_index),
                                        StringField("chunk_id", chunk.chunk_id), IntField("size_bytes", static_cast<int64_t>(chunk.size_bytes)),
                                        BoolField("overwrote", previous.has_value())});

  if (scheduler_) {
    scheduler_->Enqueue({chunk.session_id, chunk.sequence_index, chunk.chunk_id});
  }
  if (notifier_) {
    notifier_->Publish(events::MakeChunkUploaded(chunk, previous.has_value()));
  }

  ChunkRef ref;
  ref.session_id         = chunk.session_id;
  ref.sequence_index     = chunk.sequence_index;
  ref.chunk_id           = chunk.chunk_id;
  ref.upload_status      = chunk.upload_status;
  ref.overwrote_existing = previous.has_value();
  ref.message            = previous ? "Chunk replaced and queued for transcription" : "Chunk uploaded and queued for transcription";
  return ref;
}

std::optional<db::model::ChunkRecord> ChunkStore::GetChunk(const std::string& session_id, uint32_t sequence_index) {
  auto tx    = repository_->Begin();
  auto chunk = repository_->GetChunk(*tx, session_id, sequence_index);
  tx->Commit();
  return chunk;
}

std::vector<db::model::ChunkRecord> ChunkStore::ListChunks(const std::string& session_id) {
  auto tx     = repository_->Begin();
  auto chunks = repository_->ListChunks(*tx, session_id);
  tx->Commit();
  return chunks;
}

std::shared_ptr<arrow::Buffer> ChunkStore::ReadBlob(const db::model::ChunkRecord& chunk) {
  return blobs_->Read(chunk.blob_key);
}

} // namespace chunkscribe::chunk
