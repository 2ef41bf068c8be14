#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::db::model {

/*
  Persistent chunk row, keyed by (session_id, sequence_index).

  chunk_id is minted on every write, so a worker holding a stale id can
  tell that the chunk was re-uploaded underneath it.
  transcript_text is engaged iff transcription_status == COMPLETED.
*/
struct ChunkRecord {
  std::string session_id;
  uint32_t    sequence_index = 0;

  std::string chunk_id;
  std::string blob_key;
  std::string file_extension;
  uint64_t    size_bytes      = 0;
  double      overlap_seconds = 0.0;
  std::string question_id;

  chunkscribe::core::v1::UploadStatus        upload_status        = chunkscribe::core::v1::UPLOAD_STATUS_UPLOADED;
  chunkscribe::core::v1::TranscriptionStatus transcription_status = chunkscribe::core::v1::TRANSCRIPTION_STATUS_PENDING;

  std::optional<std::string>                 transcript_text;
  std::vector<chunkscribe::core::v1::Segment> segments;
  double                                     confidence_score = 0.0;
  double                                     duration_seconds = 0.0;
  std::string                                language;

  uint32_t    attempts = 0;
  std::string last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace chunkscribe::db::model
