#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <string>

namespace chunkscribe::tts {

struct SynthesisRequest {
  std::string               text;
  std::string               voice;
  std::string               format;
  std::chrono::milliseconds timeout{30'000};
};

struct SynthesisResult {
  std::shared_ptr<arrow::Buffer> audio;
  std::string                    content_type;
};

/*
  Text-to-speech provider.
  Throws std::runtime_error when the provider fails; nothing is cached then.
*/
class SpeechSynthesizer {
 public:
  virtual ~SpeechSynthesizer() = default;

  virtual SynthesisResult Synthesize(const SynthesisRequest& request) = 0;

  virtual std::string Name() const = 0;
};

} // namespace chunkscribe::tts
