#include "http_stt_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "chunkscribe/provider/v1/whisper.pb.h"
#include "internal/observability/logging.hpp"

namespace chunkscribe::stt {

using chunkscribe::observability::StringField;

namespace {

std::string TrimText(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::string ErrorMessage(const http::HttpResponse& response) {
  chunkscribe::provider::v1::WhisperErrorResponse error;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  if (google::protobuf::util::JsonStringToMessage(response.body, &error, options).ok() && !error.error().message().empty()) {
    return "HTTP " + std::to_string(response.status_code) + ": " + error.error().message();
  }
  return "HTTP " + std::to_string(response.status_code);
}

} // namespace

HttpSpeechToTextProvider::HttpSpeechToTextProvider(std::shared_ptr<http::HttpClient> client, chunkscribe::runtime::config::SpeechToTextConfig config)
    : client_(std::move(client)), config_(std::move(config)) {
  if (const char* key = std::getenv(config_.api_key_env().c_str())) {
    api_key_ = key;
  } else {
    CHUNKSCRIBE_LOG_WARN("Speech-to-text API key not set", {StringField("env", config_.api_key_env())});
  }
}

SttOutcome HttpSpeechToTextProvider::ParseVerboseJson(const std::string& body) {
  chunkscribe::provider::v1::WhisperVerboseResponse parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &parsed, options);
  if (!status.ok()) {
    return SttOutcome::Failure(SttErrorKind::kTransient, "unparsable provider response: " + std::string(status.message()));
  }

  SttOutcome outcome;
  outcome.text             = TrimText(parsed.text());
  outcome.language         = parsed.language();
  outcome.duration_seconds = parsed.duration();

  for (const auto& in : parsed.segments()) {
    chunkscribe::core::v1::Segment segment;
    segment.set_start_seconds(in.start());
    segment.set_end_seconds(in.end());
    segment.set_text(TrimText(in.text()));
    segment.set_confidence(std::clamp(std::exp(in.avg_logprob()), 0.0, 1.0));
    outcome.segments.push_back(std::move(segment));
  }

  if (outcome.duration_seconds <= 0.0 && !outcome.segments.empty()) {
    outcome.duration_seconds = outcome.segments.back().end_seconds();
  }
  return outcome;
}

SttOutcome HttpSpeechToTextProvider::Transcribe(const SttRequest& request) {
  if (!request.audio) {
    return SttOutcome::Failure(SttErrorKind::kRejected, "no audio");
  }

  http::HttpRequest http_request;
  http_request.url     = config_.base_url() + "/audio/transcriptions";
  http_request.timeout = request.timeout;
  if (!api_key_.empty()) {
    http_request.headers.push_back("Authorization: Bearer " + api_key_);
  }

  http::MultipartField file;
  file.name      = "file";
  file.value     = request.audio->ToString();
  file.file_name = request.file_name;

  http_request.multipart = {
      std::move(file),
      {"model", config_.model(), "", ""},
      {"response_format", "verbose_json", "", ""},
      {"timestamp_granularities[]", "segment", "", ""},
  };

  const auto response = client_->Post(http_request);

  switch (response.transport_error) {
    case http::TransportError::kNone:
      break;
    case http::TransportError::kTimeout:
      return SttOutcome::Failure(SttErrorKind::kTimeout, response.transport_message);
    default:
      return SttOutcome::Failure(SttErrorKind::kTransient, response.transport_message);
  }

  if (response.status_code == 429) {
    return SttOutcome::Failure(SttErrorKind::kRateLimited, ErrorMessage(response));
  }
  if (response.status_code == 408 || response.status_code >= 500) {
    return SttOutcome::Failure(SttErrorKind::kTransient, ErrorMessage(response));
  }
  if (!response.Ok()) {
    return SttOutcome::Failure(SttErrorKind::kRejected, ErrorMessage(response));
  }

  return ParseVerboseJson(response.body);
}

} // namespace chunkscribe::stt
