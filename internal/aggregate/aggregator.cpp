#include "aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "internal/util/errors.hpp"

namespace chunkscribe::aggregate {

using namespace chunkscribe::core::v1;

namespace {

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string Trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace

OverlapPolicy OverlapPolicy::FromConfig(const chunkscribe::runtime::config::AggregationConfig& config) {
  OverlapPolicy policy;
  policy.char_budget      = config.char_budget();
  policy.words_per_second = config.words_per_second();
  policy.chars_per_word   = config.chars_per_word();
  return policy;
}

size_t OverlapPolicy::WindowFor(double overlap_seconds) const {
  if (!(overlap_seconds > 0.0)) return 0;
  const double estimate = std::ceil(overlap_seconds * words_per_second * chars_per_word);
  if (estimate >= static_cast<double>(char_budget)) return char_budget;
  return static_cast<size_t>(estimate);
}

std::string MergeWithOverlap(const std::string& accumulated, const std::string& next, size_t window) {
  if (accumulated.empty()) return next;
  if (next.empty()) return accumulated;

  const size_t longest = std::min({window, accumulated.size(), next.size()});
  for (size_t length = longest; length > 0; --length) {
    const size_t suffix_start = accumulated.size() - length;
    if (accumulated.compare(suffix_start, length, next, 0, length) != 0) continue;

    // word boundaries on both ends, unless the whole window matched
    const bool starts_on_boundary = suffix_start == 0 || !IsWordChar(accumulated[suffix_start - 1]);
    const bool ends_on_boundary   = length == next.size() || !IsWordChar(next[length]);
    if (length != window && !(starts_on_boundary && ends_on_boundary)) continue;

    // whitespace or punctuation alone is not an overlap
    const bool has_word = std::any_of(next.begin(), next.begin() + static_cast<std::ptrdiff_t>(length), IsWordChar);
    if (!has_word) continue;

    return accumulated + next.substr(length);
  }
  return accumulated + " " + next;
}

Aggregator::Aggregator(std::shared_ptr<db::Repository> repository, OverlapPolicy policy)
    : repository_(std::move(repository)), policy_(policy) {
}

AggregatedTranscript Aggregator::Aggregate(const std::string& session_id) {
  std::vector<db::model::ChunkRecord> chunks;
  {
    auto tx = repository_->Begin();
    chunks  = repository_->ListChunks(*tx, session_id);
    tx->Commit();
  }
  return AggregateChunks(session_id, std::move(chunks));
}

AggregatedTranscript Aggregator::AggregateChunks(const std::string& session_id, std::vector<db::model::ChunkRecord> chunks) const {
  if (chunks.empty()) {
    throw util::NotFound("session " + session_id + " has no chunks");
  }

  std::sort(chunks.begin(), chunks.end(), [](const auto& a, const auto& b) { return a.sequence_index < b.sequence_index; });

  AggregatedTranscript result;
  result.set_session_id(session_id);
  result.set_total_chunks(static_cast<uint32_t>(chunks.size()));

  std::string text;
  double      confidence_sum = 0.0;
  uint32_t    completed      = 0;
  uint32_t    failed         = 0;
  double      duration       = 0.0;

  for (const auto& chunk : chunks) {
    duration += chunk.duration_seconds;

    if (chunk.transcription_status == TRANSCRIPTION_STATUS_FAILED) {
      ++failed;
      continue;
    }
    if (chunk.transcription_status != TRANSCRIPTION_STATUS_COMPLETED) {
      continue;
    }

    ++completed;
    confidence_sum += chunk.confidence_score;

    const std::string piece = Trim(chunk.transcript_text.value_or(""));
    text                    = MergeWithOverlap(text, piece, policy_.WindowFor(chunk.overlap_seconds));

    for (const auto& segment : chunk.segments) {
      auto* out = result.add_segments();
      *out      = segment;
      out->set_sequence_index(chunk.sequence_index);
    }
  }

  result.set_full_transcript(Trim(text));
  result.set_completed_chunks(completed);
  result.set_failed_chunks(failed);
  result.set_confidence_score(completed ? confidence_sum / completed : 0.0);
  result.set_duration_seconds(duration);
  return result;
}

} // namespace chunkscribe::aggregate
