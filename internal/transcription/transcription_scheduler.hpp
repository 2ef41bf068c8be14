#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "transcription_task.hpp"

namespace chunkscribe::transcription {

/*
  Thread-safe blocking queue shared by all transcription workers.

  Tracks outstanding work (queued + being processed) so callers can
  wait for the pool to drain.
*/
class TranscriptionScheduler {
 public:
  void Enqueue(const TranscriptionTask& task);

  // blocking wait; nullopt once shut down and drained
  std::optional<TranscriptionTask> Dequeue();

  // Called by a worker when it finished a dequeued task.
  void MarkDone();

  // Blocks until every enqueued task was dequeued and marked done.
  void WaitIdle();

  size_t Depth() const;

  void Shutdown();

 private:
  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::condition_variable         idle_cv_;
  std::queue<TranscriptionTask>   queue_;
  size_t                          outstanding_ = 0;
  bool                            shutdown_    = false;
};

} // namespace chunkscribe::transcription
