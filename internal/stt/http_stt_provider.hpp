#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "speech_to_text.hpp"

namespace chunkscribe::stt {

/*
  Whisper-compatible "/audio/transcriptions" client.

  Sends the chunk as multipart form data with response_format=verbose_json
  and segment timestamps. Classification of failures:
    transport timeout   -> kTimeout
    other transport     -> kTransient
    HTTP 429            -> kRateLimited
    HTTP 408 / 5xx      -> kTransient
    other HTTP 4xx      -> kRejected
    unparsable body     -> kTransient
*/
class HttpSpeechToTextProvider final : public SpeechToTextProvider {
 public:
  HttpSpeechToTextProvider(std::shared_ptr<http::HttpClient> client, chunkscribe::runtime::config::SpeechToTextConfig config);

  SttOutcome Transcribe(const SttRequest& request) override;

  std::string Name() const override {
    return "http:" + config_.base_url();
  }

  // Exposed for tests: maps a successful verbose_json body to an outcome.
  static SttOutcome ParseVerboseJson(const std::string& body);

 private:
  std::shared_ptr<http::HttpClient>                 client_;
  chunkscribe::runtime::config::SpeechToTextConfig  config_;
  std::string                                       api_key_;
};

} // namespace chunkscribe::stt
