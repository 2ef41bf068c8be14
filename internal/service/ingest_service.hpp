#pragma once

#include "chunkscribe/services/v1/ingest_service.pb.h"
#include "service_context.hpp"

namespace chunkscribe::service {

class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  chunkscribe::services::v1::OpenSessionResponse OpenSession(const chunkscribe::services::v1::OpenSessionRequest& req);

  chunkscribe::services::v1::UploadChunkResponse UploadChunk(const chunkscribe::services::v1::UploadChunkRequest& req);

  chunkscribe::services::v1::GetSessionTranscriptResponse GetSessionTranscript(const chunkscribe::services::v1::GetSessionTranscriptRequest& req);

  chunkscribe::services::v1::FindGapsResponse FindGaps(const chunkscribe::services::v1::FindGapsRequest& req);

  chunkscribe::services::v1::GetSessionSummaryResponse GetSessionSummary(const chunkscribe::services::v1::GetSessionSummaryRequest& req);

  chunkscribe::services::v1::FinalizeSessionResponse FinalizeSession(const chunkscribe::services::v1::FinalizeSessionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace chunkscribe::service
