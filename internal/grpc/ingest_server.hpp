#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "chunkscribe/services/v1/ingest_service.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace chunkscribe::grpc {

class IngestServer final : public chunkscribe::services::v1::IngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<chunkscribe::service::IngestService> svc);

  ::grpc::Status OpenSession(::grpc::ServerContext*, const chunkscribe::services::v1::OpenSessionRequest*, chunkscribe::services::v1::OpenSessionResponse*) override;

  ::grpc::Status UploadChunk(::grpc::ServerContext*, const chunkscribe::services::v1::UploadChunkRequest*, chunkscribe::services::v1::UploadChunkResponse*) override;

  ::grpc::Status GetSessionTranscript(::grpc::ServerContext*, const chunkscribe::services::v1::GetSessionTranscriptRequest*, chunkscribe::services::v1::GetSessionTranscriptResponse*) override;

  ::grpc::Status FindGaps(::grpc::ServerContext*, const chunkscribe::services::v1::FindGapsRequest*, chunkscribe::services::v1::FindGapsResponse*) override;

  ::grpc::Status GetSessionSummary(::grpc::ServerContext*, const chunkscribe::services::v1::GetSessionSummaryRequest*, chunkscribe::services::v1::GetSessionSummaryResponse*) override;

  ::grpc::Status FinalizeSession(::grpc::ServerContext*, const chunkscribe::services::v1::FinalizeSessionRequest*, chunkscribe::services::v1::FinalizeSessionResponse*) override;

 private:
  std::shared_ptr<chunkscribe::service::IngestService> service_;
};

} // namespace chunkscribe::grpc
