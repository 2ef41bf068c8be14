#pragma once

#include <cstdint>
#include <string>

namespace chunkscribe::transcription {

/*
  A request to transcribe one stored chunk.

  chunk_id pins the task to one upload: if the chunk was overwritten
  since the task was queued, the worker drops it (the re-upload queued
  its own task).
*/
struct TranscriptionTask {
  std::string session_id;
  uint32_t    sequence_index = 0;
  std::string chunk_id;
};

}
