#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace chunkscribe::db {
class Repository;
}
namespace chunkscribe::events {
class EventNotifier;
}
namespace chunkscribe::transcription {
class TranscriptionWorkerPool;
}
namespace chunkscribe::cache {
class CacheJanitor;
}

namespace chunkscribe::factory {

/*
  Application

  Owns every long-lived component of the process. Background threads are
  started by Start() and joined by Stop(); callers stop the transport
  before calling Stop().
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<events::EventNotifier>                notifier;
  std::shared_ptr<transcription::TranscriptionWorkerPool> workers;
  std::shared_ptr<cache::CacheJanitor>                  janitor;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  void Start();
  void Stop();
};

/*
  Composition root: the only place that knows concrete repository,
  storage and provider types.
*/
std::shared_ptr<db::Repository> BuildRepository(const chunkscribe::runtime::config::RuntimeConfig& config);

Application Build(const chunkscribe::runtime::config::RuntimeConfig& config);

} // namespace chunkscribe::factory
