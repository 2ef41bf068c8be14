#include "speech_to_text.hpp"

namespace chunkscribe::stt {

const char* ToString(SttErrorKind kind) {
  switch (kind) {
    case SttErrorKind::kNone:
      return "none";
    case SttErrorKind::kTimeout:
      return "timeout";
    case SttErrorKind::kRateLimited:
      return "rate_limited";
    case SttErrorKind::kTransient:
      return "transient";
    case SttErrorKind::kRejected:
      return "rejected";
  }
  return "unknown";
}

double WeightedConfidence(const std::vector<chunkscribe::core::v1::Segment>& segments) {
  double weighted = 0.0;
  double total    = 0.0;
  for (const auto& segment : segments) {
    const double weight = segment.end_seconds() - segment.start_seconds();
    if (weight <= 0.0) continue;
    weighted += segment.confidence() * weight;
    total += weight;
  }
  return total > 0.0 ? weighted / total : 0.0;
}

} // namespace chunkscribe::stt
