#include "synthesis_service.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkscribe::tts {

using chunkscribe::observability::BoolField;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

namespace {

constexpr const char* kKind = "tts";

constexpr size_t kMaxVoiceLength = 64;

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

SpeechSynthesisService::SpeechSynthesisService(std::shared_ptr<cache::ArtifactCache> cache, std::shared_ptr<SpeechSynthesizer> synthesizer,
                                               chunkscribe::runtime::config::TextToSpeechConfig config)
    : cache_(std::move(cache)), synthesizer_(std::move(synthesizer)), config_(std::move(config)) {
}

double SpeechSynthesisService::EstimateDurationSeconds(const std::string& text) {
  std::istringstream in(text);
  size_t             words = 0;
  for (std::string word; in >> word;) {
    ++words;
  }
  return std::max(1.0, static_cast<double>(words) / 150.0 * 60.0);
}

std::string SpeechSynthesisService::ContentTypeFor(const std::string& format) {
  if (format == "mp3") return "audio/mpeg";
  if (format == "opus") return "audio/opus";
  if (format == "aac") return "audio/aac";
  if (format == "flac") return "audio/flac";
  if (format == "wav") return "audio/wav";
  if (format == "pcm") return "audio/pcm";
  return {};
}

SynthesisOutcome SpeechSynthesisService::Synthesize(const std::string& text, const std::string& voice, const std::string& format) {
  if (IsBlank(text)) {
    throw util::ValidationError("text must not be empty");
  }
  if (text.size() > kMaxSynthesisTextLength) {
    throw util::ValidationError("text longer than " + std::to_string(kMaxSynthesisTextLength) + " characters");
  }

  const std::string effective_voice  = voice.empty() ? config_.default_voice() : voice;
  const std::string effective_format = format.empty() ? config_.default_format() : format;

  if (effective_voice.size() > kMaxVoiceLength) {
    throw util::ValidationError("voice name too long");
  }
  const std::string content_type = ContentTypeFor(effective_format);
  if (content_type.empty()) {
    throw util::ValidationError("unsupported audio format '" + effective_format + "'");
  }

  const cache::CacheInputs inputs = {
      {"text", text},
      {"voice", effective_voice},
      {"format", effective_format},
      {"model", config_.model()},
  };

  auto lookup = cache_->GetOrCompute(kKind, inputs, [&]() {
    SynthesisRequest request;
    request.text    = text;
    request.voice   = effective_voice;
    request.format  = effective_format;
    request.timeout = std::chrono::milliseconds(config_.timeout_ms());

    auto result = synthesizer_->Synthesize(request);

    cache::Artifact artifact;
    artifact.data             = std::move(result.audio);
    artifact.content_type     = content_type;
    artifact.duration_seconds = EstimateDurationSeconds(text);
    return artifact;
  });

  CHUNKSCRIBE_LOG_INFO("Speech synthesized", {StringField("key", lookup.entry.key), StringField("voice", effective_voice),
                                              IntField("size_bytes", static_cast<int64_t>(lookup.entry.size_bytes)),
                                              BoolField("cached", lookup.was_cached)});
  return {lookup.entry, lookup.was_cached};
}

} // namespace chunkscribe::tts
