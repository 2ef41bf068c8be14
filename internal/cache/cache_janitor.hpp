#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "artifact_cache.hpp"

namespace chunkscribe::cache {

/*
  Periodically runs ArtifactCache::Cleanup.
*/
class CacheJanitor {
 public:
  CacheJanitor(std::shared_ptr<ArtifactCache> cache, std::chrono::seconds interval);
  ~CacheJanitor();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<ArtifactCache> cache_;
  std::chrono::seconds           interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace chunkscribe::cache
