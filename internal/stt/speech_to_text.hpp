#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::stt {

struct SttRequest {
  std::shared_ptr<arrow::Buffer> audio;
  std::string                    file_name;
  std::chrono::milliseconds      timeout{30'000};
};

enum class SttErrorKind {
  kNone,
  kTimeout,
  kRateLimited,
  kTransient,
  kRejected,
};

inline bool IsRetryable(SttErrorKind kind) {
  return kind == SttErrorKind::kTimeout || kind == SttErrorKind::kRateLimited || kind == SttErrorKind::kTransient;
}

const char* ToString(SttErrorKind kind);

/*
  Result of one provider call.

  Failures are values: the worker decides about retries from error_kind,
  so providers never throw for remote errors.
  Segment times are relative to the start of the submitted audio.
*/
struct SttOutcome {
  SttErrorKind error_kind = SttErrorKind::kNone;
  std::string  error_message;

  std::string                                  text;
  std::vector<chunkscribe::core::v1::Segment> segments;
  double                                       duration_seconds = 0.0;
  std::string                                  language;

  bool Ok() const {
    return error_kind == SttErrorKind::kNone;
  }

  static SttOutcome Failure(SttErrorKind kind, std::string message) {
    SttOutcome outcome;
    outcome.error_kind    = kind;
    outcome.error_message = std::move(message);
    return outcome;
  }
};

class SpeechToTextProvider {
 public:
  virtual ~SpeechToTextProvider() = default;

  virtual SttOutcome Transcribe(const SttRequest& request) = 0;

  virtual std::string Name() const = 0;
};

// Duration-weighted mean of segment confidences. Zero-length segments
// weigh nothing; no weight at all yields 0.
double WeightedConfidence(const std::vector<chunkscribe::core::v1::Segment>& segments);

} // namespace chunkscribe::stt
