#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/stt/speech_to_text.hpp"
#include "transcription_scheduler.hpp"

namespace chunkscribe::session {
class SessionLifecycle;
}

namespace chunkscribe::transcription {

struct RetryPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  double                    backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{10'000};
  std::chrono::milliseconds call_timeout{30'000};

  static RetryPolicy FromConfig(const chunkscribe::runtime::config::TranscriptionConfig& transcription,
                                const chunkscribe::runtime::config::SpeechToTextConfig&  stt);
};

/*
  Fixed pool of threads that turn pending chunks into transcripts.

  Each task is pinned to one chunk_id. Results for a chunk that was
  re-uploaded in the meantime are discarded; the re-upload queued its own
  task. Once a chunk settles (completed or failed) the session lifecycle
  is asked to re-evaluate completion.
*/
class TranscriptionWorkerPool {
 public:
  TranscriptionWorkerPool(std::shared_ptr<TranscriptionScheduler> scheduler, std::shared_ptr<db::Repository> repository,
                          storage::StorageBackendPtr blobs, std::shared_ptr<stt::SpeechToTextProvider> provider, RetryPolicy policy,
                          uint32_t workers);
  ~TranscriptionWorkerPool();

  void SetLifecycle(std::shared_ptr<session::SessionLifecycle> lifecycle);

  // Re-enqueues work left unfinished by a previous process, then starts the threads.
  void Start();
  void Stop();

  // Re-queues every pending or processing chunk. Returns how many.
  size_t RecoverUnfinished();

  // Runs one task on the calling thread.
  void Process(const TranscriptionTask& task);

 private:
  void Run();

  // false if the pool is stopping
  bool WaitBackoff(std::chrono::milliseconds delay);

  // Applies mutate to the row if it still belongs to the task's chunk_id.
  bool UpdateIfCurrent(const TranscriptionTask& task, const std::function<void(db::model::ChunkRecord&)>& mutate, bool recompute_duration);

  void NotifySettled(const TranscriptionTask& task);

  std::shared_ptr<TranscriptionScheduler>     scheduler_;
  std::shared_ptr<db::Repository>             repository_;
  storage::StorageBackendPtr                  blobs_;
  std::shared_ptr<stt::SpeechToTextProvider>  provider_;
  RetryPolicy                                 policy_;
  uint32_t                                    worker_count_;
  std::shared_ptr<session::SessionLifecycle>  lifecycle_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stopping_ = false;
};

} // namespace chunkscribe::transcription
