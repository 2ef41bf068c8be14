#pragma once

#include <memory>

namespace chunkscribe::chunk {
class ChunkStore;
class GapDetector;
}
namespace chunkscribe::session {
class SessionLifecycle;
class MaintenanceRunner;
}
namespace chunkscribe::cache {
class ArtifactCache;
}
namespace chunkscribe::tts {
class SpeechSynthesisService;
}
namespace chunkscribe::transcription {
class TranscriptionScheduler;
}
namespace chunkscribe::db {
class Repository;
}

namespace chunkscribe::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<chunkscribe::db::Repository>                     repository;
  std::shared_ptr<chunkscribe::chunk::ChunkStore>                  chunks;
  std::shared_ptr<chunkscribe::chunk::GapDetector>                 gaps;
  std::shared_ptr<chunkscribe::session::SessionLifecycle>          lifecycle;
  std::shared_ptr<chunkscribe::session::MaintenanceRunner>         maintenance;
  std::shared_ptr<chunkscribe::cache::ArtifactCache>               cache;
  std::shared_ptr<chunkscribe::tts::SpeechSynthesisService>        synthesis;
  std::shared_ptr<chunkscribe::transcription::TranscriptionScheduler> scheduler;
};

} // namespace chunkscribe::service
