#include "gap_detector.hpp"

#include "internal/observability/logging.hpp"

namespace chunkscribe::chunk {

using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

namespace {

std::vector<uint32_t> IndicesOf(const std::vector<db::model::ChunkRecord>& chunks) {
  std::vector<uint32_t> indices;
  indices.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    indices.push_back(chunk.sequence_index);
  }
  return indices;
}

std::string JoinIndices(const std::vector<uint32_t>& indices) {
  std::string out;
  for (size_t i = 0; i < indices.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(indices[i]);
  }
  return out;
}

} // namespace

GapDetector::GapDetector(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<uint32_t> GapDetector::ComputeGaps(const std::vector<uint32_t>& sorted_indices) {
  std::vector<uint32_t> gaps;
  if (sorted_indices.empty()) {
    return gaps;
  }

  uint32_t expected = sorted_indices.front();
  for (uint32_t index : sorted_indices) {
    for (; expected < index; ++expected) {
      gaps.push_back(expected);
    }
    expected = index + 1;
  }
  return gaps;
}

std::vector<uint32_t> GapDetector::FindGaps(const std::string& session_id) {
  auto tx     = repository_->Begin();
  auto chunks = repository_->ListChunks(*tx, session_id);
  tx->Commit();

  // ListChunks is ordered by sequence_index
  return ComputeGaps(IndicesOf(chunks));
}

std::map<std::string, std::vector<uint32_t>> GapDetector::SweepActiveSessions() {
  std::map<std::string, std::vector<uint32_t>> result;

  auto tx = repository_->Begin();
  for (const auto& session : repository_->ListSessionsByStatus(*tx, chunkscribe::core::v1::SESSION_STATUS_RECEIVING)) {
    auto gaps = ComputeGaps(IndicesOf(repository_->ListChunks(*tx, session.session_id)));
    if (!gaps.empty()) {
      result.emplace(session.session_id, std::move(gaps));
    }
  }
  tx->Commit();

  for (const auto& [session_id, gaps] : result) {
    CHUNKSCRIBE_LOG_WARN("Session has missing chunks", {StringField("session_id", session_id), IntField("missing", static_cast<int64_t>(gaps.size())),
                                                        StringField("indices", JoinIndices(gaps))});
  }
  return result;
}

} // namespace chunkscribe::chunk
