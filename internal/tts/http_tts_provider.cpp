#include "http_tts_provider.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace chunkscribe::tts {

using chunkscribe::observability::StringField;

HttpSpeechSynthesizer::HttpSpeechSynthesizer(std::shared_ptr<http::HttpClient> client, chunkscribe::runtime::config::TextToSpeechConfig config)
    : client_(std::move(client)), config_(std::move(config)) {
  if (const char* key = std::getenv(config_.api_key_env().c_str())) {
    api_key_ = key;
  } else {
    CHUNKSCRIBE_LOG_WARN("Text-to-speech API key not set", {StringField("env", config_.api_key_env())});
  }
}

SynthesisResult HttpSpeechSynthesizer::Synthesize(const SynthesisRequest& request) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["model"].set_string_value(config_.model());
  fields["input"].set_string_value(request.text);
  fields["voice"].set_string_value(request.voice);
  fields["response_format"].set_string_value(request.format);

  http::HttpRequest http_request;
  http_request.url     = config_.base_url() + "/audio/speech";
  http_request.timeout = request.timeout;
  http_request.headers = {"Content-Type: application/json"};
  if (!api_key_.empty()) {
    http_request.headers.push_back("Authorization: Bearer " + api_key_);
  }

  auto status = google::protobuf::util::MessageToJsonString(body, &http_request.body);
  if (!status.ok()) {
    throw std::runtime_error("encode speech request: " + std::string(status.message()));
  }

  const auto response = client_->Post(http_request);
  if (response.transport_error != http::TransportError::kNone) {
    throw std::runtime_error("speech provider unreachable: " + response.transport_message);
  }
  if (!response.Ok()) {
    throw std::runtime_error("speech provider answered HTTP " + std::to_string(response.status_code));
  }
  if (response.body.empty()) {
    throw std::runtime_error("speech provider returned no audio");
  }

  return {storage::common::CopyToBuffer(response.body), response.content_type};
}

} // namespace chunkscribe::tts
