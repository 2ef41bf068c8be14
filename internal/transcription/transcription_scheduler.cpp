#include "transcription_scheduler.hpp"

namespace chunkscribe::transcription {

void TranscriptionScheduler::Enqueue(const TranscriptionTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(task);
    ++outstanding_;
  }
  cv_.notify_one();
}

std::optional<TranscriptionTask> TranscriptionScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  TranscriptionTask task = queue_.front();
  queue_.pop();
  return task;
}

void TranscriptionScheduler::MarkDone() {
  bool idle = false;
  {
    std::lock_guard lock(mutex_);
    if (outstanding_ > 0) --outstanding_;
    idle = outstanding_ == 0;
  }
  if (idle) idle_cv_.notify_all();
}

void TranscriptionScheduler::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return outstanding_ == 0; });
}

size_t TranscriptionScheduler::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void TranscriptionScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace chunkscribe::transcription
