#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace chunkscribe::grpc {

IngestServer::IngestServer(std::shared_ptr<chunkscribe::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::OpenSession(::grpc::ServerContext*, const chunkscribe::services::v1::OpenSessionRequest* req, chunkscribe::services::v1::OpenSessionResponse* resp) {
  try {
    *resp = service_->OpenSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::UploadChunk(::grpc::ServerContext*, const chunkscribe::services::v1::UploadChunkRequest* req, chunkscribe::services::v1::UploadChunkResponse* resp) {
  try {
    *resp = service_->UploadChunk(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::GetSessionTranscript(::grpc::ServerContext*, const chunkscribe::services::v1::GetSessionTranscriptRequest* req, chunkscribe::services::v1::GetSessionTranscriptResponse* resp) {
  try {
    *resp = service_->GetSessionTranscript(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::FindGaps(::grpc::ServerContext*, const chunkscribe::services::v1::FindGapsRequest* req, chunkscribe::services::v1::FindGapsResponse* resp) {
  try {
    *resp = service_->FindGaps(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::GetSessionSummary(::grpc::ServerContext*, const chunkscribe::services::v1::GetSessionSummaryRequest* req, chunkscribe::services::v1::GetSessionSummaryResponse* resp) {
  try {
    *resp = service_->GetSessionSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::FinalizeSession(::grpc::ServerContext*, const chunkscribe::services::v1::FinalizeSessionRequest* req, chunkscribe::services::v1::FinalizeSessionResponse* resp) {
  try {
    *resp = service_->FinalizeSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chunkscribe::grpc
