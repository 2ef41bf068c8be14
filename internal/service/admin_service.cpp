#include "admin_service.hpp"

#include "internal/cache/artifact_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/session/maintenance_runner.hpp"
#include "internal/transcription/transcription_scheduler.hpp"
#include "observe_rpc.hpp"

namespace chunkscribe::service {

using namespace chunkscribe::admin::v1;
using namespace chunkscribe::core::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;

    auto tx = ctx_.repository->Begin();
    for (const auto& session : ctx_.repository->ListSessions(*tx)) {
      switch (session.status) {
        case SESSION_STATUS_OPEN:
          resp.set_sessions_open(resp.sessions_open() + 1);
          break;
        case SESSION_STATUS_RECEIVING:
          resp.set_sessions_receiving(resp.sessions_receiving() + 1);
          break;
        case SESSION_STATUS_COMPLETED:
          resp.set_sessions_completed(resp.sessions_completed() + 1);
          break;
        case SESSION_STATUS_FAILED:
          resp.set_sessions_failed(resp.sessions_failed() + 1);
          break;
        default:
          break;
      }

      for (const auto& chunk : ctx_.repository->ListChunks(*tx, session.session_id)) {
        resp.set_chunk_bytes(resp.chunk_bytes() + chunk.size_bytes);
        switch (chunk.transcription_status) {
          case TRANSCRIPTION_STATUS_PENDING:
            resp.set_chunks_pending(resp.chunks_pending() + 1);
            break;
          case TRANSCRIPTION_STATUS_PROCESSING:
            resp.set_chunks_processing(resp.chunks_processing() + 1);
            break;
          case TRANSCRIPTION_STATUS_COMPLETED:
            resp.set_chunks_completed(resp.chunks_completed() + 1);
            break;
          case TRANSCRIPTION_STATUS_FAILED:
            resp.set_chunks_failed(resp.chunks_failed() + 1);
            break;
          default:
            break;
        }
      }
    }

    for (const auto& entry : ctx_.repository->ListCacheEntries(*tx)) {
      resp.set_cache_entries(resp.cache_entries() + 1);
      resp.set_cache_bytes(resp.cache_bytes() + entry.size_bytes);
    }
    tx->Commit();

    if (ctx_.scheduler) {
      resp.set_transcription_queue_depth(ctx_.scheduler->Depth());
    }
    return resp;
  });
}

RunMaintenanceResponse AdminService::RunMaintenance(const RunMaintenanceRequest& req) {
  return ObserveRpc("AdminService.RunMaintenance", "", [&] {
    session::MaintenanceOptions options;
    options.cache_cleanup = req.cache_cleanup();
    options.gap_sweep     = req.gap_sweep();
    options.retention     = req.retention();

    const auto report = ctx_.maintenance->RunOnce(options);

    RunMaintenanceResponse resp;
    resp.set_cache_entries_removed(report.cache.Removed());
    resp.set_cache_bytes_removed(report.cache.bytes_freed);
    for (const auto& [session_id, gaps] : report.sessions_with_gaps) {
      auto* out = resp.add_sessions_with_gaps();
      out->set_session_id(session_id);
      for (uint32_t index : gaps) out->add_missing_indices(index);
    }
    resp.set_sessions_removed(report.retention.sessions_removed);
    resp.set_chunks_removed(report.retention.chunks_removed);
    return resp;
  });
}

} // namespace chunkscribe::service
