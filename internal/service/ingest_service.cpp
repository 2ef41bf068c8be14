#include "ingest_service.hpp"

#include "internal/chunk/chunk_store.hpp"
#include "internal/chunk/gap_detector.hpp"
#include "internal/model/session_state.hpp"
#include "internal/session/session_lifecycle.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace chunkscribe::service {

using namespace chunkscribe::core::v1;
using namespace chunkscribe::services::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

OpenSessionResponse IngestService::OpenSession(const OpenSessionRequest& req) {
  return ObserveRpc("IngestService.OpenSession", req.session_id(), [&] {
    std::optional<uint32_t> total;
    if (req.has_total_chunks_expected()) total = req.total_chunks_expected();

    OpenSessionResponse resp;
    *resp.mutable_session() = session::ToDescriptor(ctx_.lifecycle->OpenSession(req.session_id(), total));
    return resp;
  });
}

UploadChunkResponse IngestService::UploadChunk(const UploadChunkRequest& req) {
  return ObserveRpc("IngestService.UploadChunk", req.session_id(), [&] {
    chunk::UploadRequest upload;
    upload.session_id     = req.session_id();
    upload.sequence_index = req.sequence_index();
    upload.file_name      = req.file_name();
    upload.question_id    = req.question_id();
    if (!req.audio().empty()) {
      upload.blob = storage::common::CopyToBuffer(req.audio());
    }
    if (req.has_overlap_seconds()) upload.overlap_seconds = req.overlap_seconds();
    if (req.has_total_chunks_expected()) upload.total_chunks_expected = req.total_chunks_expected();
    if (req.has_duration_seconds()) upload.duration_seconds = req.duration_seconds();

    const auto ref = ctx_.chunks->UpsertChunk(upload);

    UploadChunkResponse resp;
    resp.set_session_id(ref.session_id);
    resp.set_sequence_index(ref.sequence_index);
    resp.set_chunk_id(ref.chunk_id);
    resp.set_upload_status(ref.upload_status);
    resp.set_message(ref.message);
    return resp;
  });
}

GetSessionTranscriptResponse IngestService::GetSessionTranscript(const GetSessionTranscriptRequest& req) {
  return ObserveRpc("IngestService.GetSessionTranscript", req.session_id(), [&] {
    auto result = ctx_.lifecycle->GetTranscript(req.session_id());

    GetSessionTranscriptResponse resp;
    resp.set_status(result.status);
    *resp.mutable_transcript() = std::move(result.transcript);
    return resp;
  });
}

FindGapsResponse IngestService::FindGaps(const FindGapsRequest& req) {
  return ObserveRpc("IngestService.FindGaps", req.session_id(), [&] {
    chunk::ValidateSessionId(req.session_id());

    FindGapsResponse resp;
    for (uint32_t index : ctx_.gaps->FindGaps(req.session_id())) {
      resp.add_missing_indices(index);
    }
    return resp;
  });
}

GetSessionSummaryResponse IngestService::GetSessionSummary(const GetSessionSummaryRequest& req) {
  return ObserveRpc("IngestService.GetSessionSummary", req.session_id(), [&] {
    auto session = ctx_.lifecycle->GetSession(req.session_id());
    if (!session) {
      throw util::NotFound("session " + req.session_id() + " not found");
    }

    GetSessionSummaryResponse resp;
    *resp.mutable_session() = session::ToDescriptor(*session);

    const auto chunks = ctx_.chunks->ListChunks(req.session_id());
    std::vector<uint32_t> indices;
    for (const auto& chunk : chunks) {
      indices.push_back(chunk.sequence_index);
      switch (chunk.transcription_status) {
        case TRANSCRIPTION_STATUS_COMPLETED:
          resp.set_chunks_completed(resp.chunks_completed() + 1);
          break;
        case TRANSCRIPTION_STATUS_FAILED:
          resp.set_chunks_failed(resp.chunks_failed() + 1);
          break;
        default:
          if (model::IsInFlight(chunk.transcription_status)) {
            resp.set_chunks_in_flight(resp.chunks_in_flight() + 1);
          }
          break;
      }
      *resp.add_chunks() = session::ToDescriptor(chunk);
    }
    resp.set_chunks_received(static_cast<uint32_t>(chunks.size()));

    for (uint32_t index : chunk::GapDetector::ComputeGaps(indices)) {
      resp.add_missing_indices(index);
    }
    return resp;
  });
}

FinalizeSessionResponse IngestService::FinalizeSession(const FinalizeSessionRequest& req) {
  return ObserveRpc("IngestService.FinalizeSession", req.session_id(), [&] {
    auto outcome = ctx_.lifecycle->FinalizeSession(req.session_id());

    FinalizeSessionResponse resp;
    *resp.mutable_session() = session::ToDescriptor(outcome.session);
    if (outcome.transcript) {
      *resp.mutable_transcript() = std::move(*outcome.transcript);
    }
    return resp;
  });
}

} // namespace chunkscribe::service
