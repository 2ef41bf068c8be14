#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/artifact_cache.hpp"
#include "internal/chunk/gap_detector.hpp"
#include "retention_sweeper.hpp"

namespace chunkscribe::session {

struct MaintenanceOptions {
  bool cache_cleanup = true;
  bool gap_sweep     = true;
  bool retention     = true;
};

struct MaintenanceReport {
  cache::CleanupReport                         cache;
  std::map<std::string, std::vector<uint32_t>> sessions_with_gaps;
  RetentionReport                              retention;
};

/*
  Housekeeping: gap sweep over RECEIVING sessions and retention of old
  terminal sessions every interval. Cache cleanup has its own janitor
  and is only included when run on demand.
*/
class MaintenanceRunner {
 public:
  MaintenanceRunner(std::shared_ptr<chunk::GapDetector> gaps, std::shared_ptr<RetentionSweeper> retention,
                    std::shared_ptr<cache::ArtifactCache> cache, std::chrono::seconds interval);
  ~MaintenanceRunner();

  void Start();
  void Stop();

  MaintenanceReport RunOnce(const MaintenanceOptions& options);

 private:
  void Loop();

  std::shared_ptr<chunk::GapDetector>   gaps_;
  std::shared_ptr<RetentionSweeper>     retention_;
  std::shared_ptr<cache::ArtifactCache> cache_;
  std::chrono::seconds                  interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace chunkscribe::session
