#include "factory.hpp"

#include <chrono>
#include <memory>
#include <vector>

#include "internal/aggregate/aggregator.hpp"
#include "internal/cache/artifact_cache.hpp"
#include "internal/cache/cache_janitor.hpp"
#include "internal/chunk/chunk_store.hpp"
#include "internal/chunk/gap_detector.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/events/log_sink.hpp"
#include "internal/events/webhook_sink.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/artifact_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/http/http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/artifact_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/session/maintenance_runner.hpp"
#include "internal/session/retention_sweeper.hpp"
#include "internal/session/session_lifecycle.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/stt/http_stt_provider.hpp"
#include "internal/transcription/transcription_scheduler.hpp"
#include "internal/transcription/transcription_worker.hpp"
#include "internal/tts/http_tts_provider.hpp"
#include "internal/tts/synthesis_service.hpp"

namespace chunkscribe::factory {

using chunkscribe::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const chunkscribe::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    CHUNKSCRIBE_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  CHUNKSCRIBE_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const chunkscribe::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto blobs      = storage::StorageFactory::Build(config.storage());

  // ------------------------------------------------------------------
  // Outbound HTTP and event fan-out
  // ------------------------------------------------------------------
  auto http_client = std::make_shared<http::HttpClient>();

  std::vector<std::shared_ptr<events::EventSink>> sinks;
  if (config.notifications().log_events()) {
    sinks.push_back(std::make_shared<events::LogSink>());
  }
  for (const auto& url : config.notifications().webhook_urls()) {
    sinks.push_back(std::make_shared<events::WebhookSink>(http_client, url, std::chrono::milliseconds(config.notifications().timeout_ms())));
  }
  auto notifier = std::make_shared<events::EventNotifier>(std::move(sinks));

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  auto cache      = std::make_shared<cache::ArtifactCache>(repository, blobs, cache::CachePolicy::FromConfig(config.cache()));
  auto aggregator = std::make_shared<aggregate::Aggregator>(repository, aggregate::OverlapPolicy::FromConfig(config.aggregation()));
  auto lifecycle  = std::make_shared<session::SessionLifecycle>(repository, aggregator, notifier, cache);

  auto scheduler = std::make_shared<transcription::TranscriptionScheduler>();
  auto stt       = std::make_shared<stt::HttpSpeechToTextProvider>(http_client, config.stt());
  auto workers   = std::make_shared<transcription::TranscriptionWorkerPool>(
      scheduler, repository, blobs, stt, transcription::RetryPolicy::FromConfig(config.transcription(), config.stt()),
      config.transcription().workers());
  workers->SetLifecycle(lifecycle);

  auto chunks = std::make_shared<chunk::ChunkStore>(repository, blobs, chunk::IngestLimits::FromConfig(config.ingest()), scheduler, notifier);
  auto gaps   = std::make_shared<chunk::GapDetector>(repository);

  auto synthesizer = std::make_shared<tts::HttpSpeechSynthesizer>(http_client, config.tts());
  auto synthesis   = std::make_shared<tts::SpeechSynthesisService>(cache, synthesizer, config.tts());

  // ------------------------------------------------------------------
  // Housekeeping
  // ------------------------------------------------------------------
  auto janitor   = std::make_shared<cache::CacheJanitor>(cache, std::chrono::seconds(config.cache().cleanup_interval_seconds()));
  auto retention = std::make_shared<session::RetentionSweeper>(repository, blobs, config.maintenance().retention_max_age_seconds() * 1000);
  auto maintenance =
      std::make_shared<session::MaintenanceRunner>(gaps, retention, cache, std::chrono::seconds(config.maintenance().interval_seconds()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = repository;
  ctx.chunks      = chunks;
  ctx.gaps        = gaps;
  ctx.lifecycle   = lifecycle;
  ctx.maintenance = maintenance;
  ctx.cache       = cache;
  ctx.synthesis   = synthesis;
  ctx.scheduler   = scheduler;

  auto ingest_service   = std::make_shared<service::IngestService>(ctx);
  auto artifact_service = std::make_shared<service::ArtifactService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::ArtifactServer>(artifact_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.context  = ctx;
  app.notifier = notifier;
  app.workers  = workers;
  app.janitor  = janitor;
  return app;
}

void Application::Start() {
  notifier->Start();
  workers->Start();
  janitor->Start();
  context.maintenance->Start();
}

void Application::Stop() {
  context.maintenance->Stop();
  janitor->Stop();
  workers->Stop();
  // last, so events published by finishing workers still go out
  notifier->Stop();
}

} // namespace chunkscribe::factory
