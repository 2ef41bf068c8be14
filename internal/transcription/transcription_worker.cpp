#include "transcription_worker.hpp"

#include <algorithm>

#include "internal/chunk/chunk_store.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session_lifecycle.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chunkscribe::transcription {

using namespace chunkscribe::core::v1;
using chunkscribe::db::ThrowIfDbError;
using chunkscribe::observability::DoubleField;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

RetryPolicy RetryPolicy::FromConfig(const chunkscribe::runtime::config::TranscriptionConfig& transcription,
                                    const chunkscribe::runtime::config::SpeechToTextConfig&  stt) {
  RetryPolicy policy;
  policy.max_attempts       = transcription.max_attempts();
  policy.initial_backoff    = std::chrono::milliseconds(transcription.initial_backoff_ms());
  policy.backoff_multiplier = transcription.backoff_multiplier();
  policy.max_backoff        = std::chrono::milliseconds(transcription.max_backoff_ms());
  policy.call_timeout       = std::chrono::milliseconds(stt.timeout_ms());
  return policy;
}

TranscriptionWorkerPool::TranscriptionWorkerPool(std::shared_ptr<TranscriptionScheduler> scheduler, std::shared_ptr<db::Repository> repository,
                                                 storage::StorageBackendPtr blobs, std::shared_ptr<stt::SpeechToTextProvider> provider,
                                                 RetryPolicy policy, uint32_t workers)
    : scheduler_(std::move(scheduler)),
      repository_(std::move(repository)),
      blobs_(std::move(blobs)),
      provider_(std::move(provider)),
      policy_(policy),
      worker_count_(std::max<uint32_t>(1, workers)) {
}

TranscriptionWorkerPool::~TranscriptionWorkerPool() {
  Stop();
}

void TranscriptionWorkerPool::SetLifecycle(std::shared_ptr<session::SessionLifecycle> lifecycle) {
  lifecycle_ = std::move(lifecycle);
}

void TranscriptionWorkerPool::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = false;
  }

  RecoverUnfinished();

  for (uint32_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&TranscriptionWorkerPool::Run, this);
  }
  CHUNKSCRIBE_LOG_INFO("Transcription workers started", {IntField("workers", worker_count_), StringField("provider", provider_->Name())});
}

void TranscriptionWorkerPool::Stop() {
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  scheduler_->Shutdown();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  running_ = false;
}

size_t TranscriptionWorkerPool::RecoverUnfinished() {
  std::vector<TranscriptionTask> tasks;
  {
    auto tx = repository_->Begin();
    for (auto status : {TRANSCRIPTION_STATUS_PENDING, TRANSCRIPTION_STATUS_PROCESSING}) {
      for (auto& chunk : repository_->ListChunksByTranscriptionStatus(*tx, status)) {
        if (chunk.transcription_status == TRANSCRIPTION_STATUS_PROCESSING) {
          chunk.transcription_status = TRANSCRIPTION_STATUS_PENDING;
          chunk.updated_at_ms        = util::NowMillis();
          ThrowIfDbError(repository_->UpdateChunk(*tx, chunk), "reset interrupted chunk");
        }
        tasks.push_back({chunk.session_id, chunk.sequence_index, chunk.chunk_id});
      }
    }
    tx->Commit();
  }

  for (const auto& task : tasks) {
    scheduler_->Enqueue(task);
  }
  if (!tasks.empty()) {
    CHUNKSCRIBE_LOG_INFO("Recovered unfinished transcription tasks", {IntField("tasks", static_cast<int64_t>(tasks.size()))});
  }
  return tasks.size();
}

void TranscriptionWorkerPool::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      Process(*task);
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_ERROR("Transcription task failed", {StringField("session_id", task->session_id),
                                                          IntField("sequence_index", task->sequence_index), StringField("error", e.what())});
    }
    scheduler_->MarkDone();
  }
}

bool TranscriptionWorkerPool::WaitBackoff(std::chrono::milliseconds delay) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [&] { return stopping_; });
}

bool TranscriptionWorkerPool::UpdateIfCurrent(const TranscriptionTask& task, const std::function<void(db::model::ChunkRecord&)>& mutate,
                                              bool recompute_duration) {
  auto tx    = repository_->Begin();
  auto chunk = repository_->GetChunk(*tx, task.session_id, task.sequence_index);
  if (!chunk || chunk->chunk_id != task.chunk_id) {
    return false;
  }

  mutate(*chunk);
  chunk->updated_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->UpdateChunk(*tx, *chunk), "update chunk");

  if (recompute_duration) {
    if (auto session = repository_->GetSession(*tx, task.session_id)) {
      session->total_duration_seconds = chunk::SumDurations(repository_->ListChunks(*tx, task.session_id));
      session->updated_at_ms          = chunk->updated_at_ms;
      ThrowIfDbError(repository_->UpdateSession(*tx, *session), "update session duration");
    }
  }

  tx->Commit();
  return true;
}

void TranscriptionWorkerPool::NotifySettled(const TranscriptionTask& task) {
  if (!lifecycle_) return;
  try {
    lifecycle_->EvaluateCompletion(task.session_id);
  } catch (const std::exception& e) {
    CHUNKSCRIBE_LOG_ERROR("Completion check failed", {StringField("session_id", task.session_id), StringField("error", e.what())});
  }
}

void TranscriptionWorkerPool::Process(const TranscriptionTask& task) {
  // ------------------------------------------------------------------
  // Claim
  // ------------------------------------------------------------------
  std::optional<db::model::ChunkRecord> chunk;
  {
    auto tx = repository_->Begin();
    chunk   = repository_->GetChunk(*tx, task.session_id, task.sequence_index);
    if (!chunk || chunk->chunk_id != task.chunk_id || chunk->transcription_status != TRANSCRIPTION_STATUS_PENDING) {
      CHUNKSCRIBE_LOG_DEBUG("Dropping stale transcription task", {StringField("session_id", task.session_id),
                                                                  IntField("sequence_index", task.sequence_index),
                                                                  StringField("chunk_id", task.chunk_id)});
      return;
    }
    chunk->transcription_status = TRANSCRIPTION_STATUS_PROCESSING;
    chunk->updated_at_ms        = util::NowMillis();
    ThrowIfDbError(repository_->UpdateChunk(*tx, *chunk), "claim chunk");
    tx->Commit();
  }

  // ------------------------------------------------------------------
  // Audio
  // ------------------------------------------------------------------
  std::shared_ptr<arrow::Buffer> audio;
  try {
    audio = blobs_->Read(chunk->blob_key);
  } catch (const util::NotFound& e) {
    CHUNKSCRIBE_LOG_ERROR("Chunk blob missing", {StringField("session_id", task.session_id), IntField("sequence_index", task.sequence_index),
                                                 StringField("blob_key", chunk->blob_key)});
    const bool settled = UpdateIfCurrent(
        task,
        [&](db::model::ChunkRecord& row) {
          row.upload_status        = UPLOAD_STATUS_FAILED;
          row.transcription_status = TRANSCRIPTION_STATUS_FAILED;
          row.last_error           = e.what();
        },
        false);
    if (settled) NotifySettled(task);
    return;
  }

  // ------------------------------------------------------------------
  // Provider calls with bounded retries
  // ------------------------------------------------------------------
  stt::SttRequest request;
  request.audio     = audio;
  request.file_name = "chunk_" + std::to_string(task.sequence_index) + "." + chunk->file_extension;
  request.timeout   = policy_.call_timeout;

  stt::SttOutcome outcome;
  auto            backoff  = policy_.initial_backoff;
  uint32_t        attempts = chunk->attempts;

  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    try {
      outcome = provider_->Transcribe(request);
    } catch (const std::exception& e) {
      outcome = stt::SttOutcome::Failure(stt::SttErrorKind::kTransient, e.what());
    }
    ++attempts;

    if (outcome.Ok()) break;

    const bool retry = stt::IsRetryable(outcome.error_kind) && attempt < policy_.max_attempts;
    CHUNKSCRIBE_LOG_WARN("Transcription attempt failed", {StringField("session_id", task.session_id), IntField("sequence_index", task.sequence_index),
                                                          IntField("attempt", attempt), StringField("kind", stt::ToString(outcome.error_kind)),
                                                          StringField("error", outcome.error_message)});
    if (!retry) break;

    const bool still_current = UpdateIfCurrent(
        task,
        [&](db::model::ChunkRecord& row) {
          row.attempts   = attempts;
          row.last_error = std::string(stt::ToString(outcome.error_kind)) + ": " + outcome.error_message;
        },
        false);
    if (!still_current) return;

    if (!WaitBackoff(backoff)) {
      // picked up again by RecoverUnfinished on the next start
      return;
    }
    backoff = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(backoff * policy_.backoff_multiplier), policy_.max_backoff);
  }

  // ------------------------------------------------------------------
  // Settle
  // ------------------------------------------------------------------
  bool settled = false;
  if (outcome.Ok()) {
    for (auto& segment : outcome.segments) {
      segment.set_sequence_index(task.sequence_index);
    }
    const double confidence = stt::WeightedConfidence(outcome.segments);

    settled = UpdateIfCurrent(
        task,
        [&](db::model::ChunkRecord& row) {
          row.transcription_status = TRANSCRIPTION_STATUS_COMPLETED;
          row.transcript_text      = outcome.text;
          row.segments             = outcome.segments;
          row.confidence_score     = confidence;
          row.duration_seconds     = outcome.duration_seconds;
          row.language             = outcome.language;
          row.attempts             = attempts;
          row.last_error.clear();
        },
        true);

    if (settled) {
      CHUNKSCRIBE_LOG_INFO("Chunk transcribed", {StringField("session_id", task.session_id), IntField("sequence_index", task.sequence_index),
                                                 DoubleField("confidence", confidence), DoubleField("duration_seconds", outcome.duration_seconds)});
    }
  } else {
    settled = UpdateIfCurrent(
        task,
        [&](db::model::ChunkRecord& row) {
          row.transcription_status = TRANSCRIPTION_STATUS_FAILED;
          row.transcript_text.reset();
          row.attempts   = attempts;
          row.last_error = std::string(stt::ToString(outcome.error_kind)) + ": " + outcome.error_message;
        },
        false);

    if (settled) {
      CHUNKSCRIBE_LOG_ERROR("Chunk transcription failed", {StringField("session_id", task.session_id),
                                                           IntField("sequence_index", task.sequence_index), IntField("attempts", attempts),
                                                           StringField("error", outcome.error_message)});
    }
  }

  if (settled) NotifySettled(task);
}

} // namespace chunkscribe::transcription
