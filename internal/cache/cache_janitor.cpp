#include "cache_janitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace chunkscribe::cache {

using chunkscribe::observability::StringField;

CacheJanitor::CacheJanitor(std::shared_ptr<ArtifactCache> cache, std::chrono::seconds interval)
    : cache_(std::move(cache)), interval_(interval) {
}

CacheJanitor::~CacheJanitor() {
  Stop();
}

void CacheJanitor::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&CacheJanitor::Loop, this);
}

void CacheJanitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void CacheJanitor::Loop() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return stopping_; })) break;
    }

    try {
      cache_->Cleanup(util::NowMillis());
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_ERROR("Cache cleanup failed", {StringField("error", e.what())});
    }
  }
}

} // namespace chunkscribe::cache
