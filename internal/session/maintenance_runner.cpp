#include "maintenance_runner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace chunkscribe::session {

using chunkscribe::observability::StringField;

MaintenanceRunner::MaintenanceRunner(std::shared_ptr<chunk::GapDetector> gaps, std::shared_ptr<RetentionSweeper> retention,
                                     std::shared_ptr<cache::ArtifactCache> cache, std::chrono::seconds interval)
    : gaps_(std::move(gaps)), retention_(std::move(retention)), cache_(std::move(cache)), interval_(interval) {
}

MaintenanceRunner::~MaintenanceRunner() {
  Stop();
}

void MaintenanceRunner::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&MaintenanceRunner::Loop, this);
}

void MaintenanceRunner::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

MaintenanceReport MaintenanceRunner::RunOnce(const MaintenanceOptions& options) {
  MaintenanceReport report;
  const auto        now = util::NowMillis();

  if (options.cache_cleanup && cache_) {
    report.cache = cache_->Cleanup(now);
  }
  if (options.gap_sweep && gaps_) {
    report.sessions_with_gaps = gaps_->SweepActiveSessions();
  }
  if (options.retention && retention_) {
    report.retention = retention_->Sweep(now);
  }
  return report;
}

void MaintenanceRunner::Loop() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return stopping_; })) break;
    }

    try {
      RunOnce({false, true, true});
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_ERROR("Maintenance pass failed", {StringField("error", e.what())});
    }
  }
}

} // namespace chunkscribe::session
