#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "speech_synthesizer.hpp"

namespace chunkscribe::tts {

// OpenAI-compatible "/audio/speech" client.
class HttpSpeechSynthesizer final : public SpeechSynthesizer {
 public:
  HttpSpeechSynthesizer(std::shared_ptr<http::HttpClient> client, chunkscribe::runtime::config::TextToSpeechConfig config);

  SynthesisResult Synthesize(const SynthesisRequest& request) override;

  std::string Name() const override {
    return "http:" + config_.base_url();
  }

 private:
  std::shared_ptr<http::HttpClient>                client_;
  chunkscribe::runtime::config::TextToSpeechConfig config_;
  std::string                                      api_key_;
};

} // namespace chunkscribe::tts
