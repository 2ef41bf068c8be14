#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "chunkscribe/services/v1/artifact_service.grpc.pb.h"
#include "internal/service/artifact_service.hpp"

namespace chunkscribe::grpc {

class ArtifactServer final : public chunkscribe::services::v1::ArtifactService::Service {
 public:
  explicit ArtifactServer(std::shared_ptr<chunkscribe::service::ArtifactService> svc);

  ::grpc::Status SynthesizeSpeech(::grpc::ServerContext*, const chunkscribe::services::v1::SynthesizeSpeechRequest*, chunkscribe::services::v1::SynthesizeSpeechResponse*) override;

  ::grpc::Status GetArtifact(::grpc::ServerContext*, const chunkscribe::services::v1::GetArtifactRequest*, chunkscribe::services::v1::GetArtifactResponse*) override;

  ::grpc::Status GetCacheStats(::grpc::ServerContext*, const chunkscribe::services::v1::GetCacheStatsRequest*, chunkscribe::services::v1::GetCacheStatsResponse*) override;

 private:
  std::shared_ptr<chunkscribe::service::ArtifactService> service_;
};

} // namespace chunkscribe::grpc
