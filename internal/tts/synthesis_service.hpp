#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/cache/artifact_cache.hpp"
#include "speech_synthesizer.hpp"

namespace chunkscribe::tts {

inline constexpr size_t kMaxSynthesisTextLength = 10'000;

struct SynthesisOutcome {
  db::model::CacheEntryRecord entry;
  bool                        was_cached = false;
};

/*
  Speech synthesis through the artifact cache.

  The fingerprint covers kind "tts", the text, the voice, the format and
  the provider model, so changing any of them produces a new artifact.
*/
class SpeechSynthesisService {
 public:
  SpeechSynthesisService(std::shared_ptr<cache::ArtifactCache> cache, std::shared_ptr<SpeechSynthesizer> synthesizer,
                         chunkscribe::runtime::config::TextToSpeechConfig config);

  // Empty voice/format fall back to the configured defaults.
  SynthesisOutcome Synthesize(const std::string& text, const std::string& voice, const std::string& format);

  // max(1, words / 150 * 60)
  static double EstimateDurationSeconds(const std::string& text);

  static std::string ContentTypeFor(const std::string& format);

 private:
  std::shared_ptr<cache::ArtifactCache>            cache_;
  std::shared_ptr<SpeechSynthesizer>               synthesizer_;
  chunkscribe::runtime::config::TextToSpeechConfig config_;
};

} // namespace chunkscribe::tts
