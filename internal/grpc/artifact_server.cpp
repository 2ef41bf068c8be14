#include "artifact_server.hpp"

#include "grpc_error.hpp"

namespace chunkscribe::grpc {

ArtifactServer::ArtifactServer(std::shared_ptr<chunkscribe::service::ArtifactService> svc) : service_(std::move(svc)) {
}

::grpc::Status ArtifactServer::SynthesizeSpeech(::grpc::ServerContext*, const chunkscribe::services::v1::SynthesizeSpeechRequest* req, chunkscribe::services::v1::SynthesizeSpeechResponse* resp) {
  try {
    *resp = service_->SynthesizeSpeech(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArtifactServer::GetArtifact(::grpc::ServerContext*, const chunkscribe::services::v1::GetArtifactRequest* req, chunkscribe::services::v1::GetArtifactResponse* resp) {
  try {
    *resp = service_->GetArtifact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArtifactServer::GetCacheStats(::grpc::ServerContext*, const chunkscribe::services::v1::GetCacheStatsRequest* req, chunkscribe::services::v1::GetCacheStatsResponse* resp) {
  try {
    *resp = service_->GetCacheStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chunkscribe::grpc
