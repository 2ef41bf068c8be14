#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace chunkscribe::chunk {

/*
  Reports sequence indices a client still has to (re-)send.

  A gap is every index in [min_stored_index, max_stored_index] without a
  row. Indices outside that range are not gaps, even when
  total_chunks_expected says they should exist.
*/
class GapDetector {
 public:
  explicit GapDetector(std::shared_ptr<db::Repository> repository);

  // Ascending; empty for unknown sessions and sessions without chunks.
  std::vector<uint32_t> FindGaps(const std::string& session_id);

  // All RECEIVING sessions that currently have gaps. Logs one warning each.
  std::map<std::string, std::vector<uint32_t>> SweepActiveSessions();

  static std::vector<uint32_t> ComputeGaps(const std::vector<uint32_t>& sorted_indices);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace chunkscribe::chunk
