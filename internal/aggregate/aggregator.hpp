#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chunkscribe/core/v1/types.pb.h"
#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace chunkscribe::aggregate {

struct OverlapPolicy {
  uint32_t char_budget      = 50;
  double   words_per_second = 2.5;
  double   chars_per_word   = 10.0;

  static OverlapPolicy FromConfig(const chunkscribe::runtime::config::AggregationConfig& config);

  // min(char_budget, ceil(overlap_seconds * words_per_second * chars_per_word))
  size_t WindowFor(double overlap_seconds) const;
};

/*
  Joins next onto accumulated.

  Looks for the longest suffix of accumulated (at most window characters)
  that equals a prefix of next and starts and ends on word boundaries.
  The matched prefix is dropped and the rest is appended as is; without a
  match the two are joined with a single space.
*/
std::string MergeWithOverlap(const std::string& accumulated, const std::string& next, size_t window);

/*
  Overlap-aware session aggregation.

  Read only. Chunks are ordered by sequence_index; only completed chunks
  contribute text, segments and confidence, but every chunk counts toward
  total_chunks.
*/
class Aggregator {
 public:
  Aggregator(std::shared_ptr<db::Repository> repository, OverlapPolicy policy);

  // Throws util::NotFound when the session has no chunks.
  chunkscribe::core::v1::AggregatedTranscript Aggregate(const std::string& session_id);

  // Same computation over rows the caller already loaded.
  chunkscribe::core::v1::AggregatedTranscript AggregateChunks(const std::string& session_id, std::vector<db::model::ChunkRecord> chunks) const;

  const OverlapPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  OverlapPolicy                   policy_;
};

} // namespace chunkscribe::aggregate
