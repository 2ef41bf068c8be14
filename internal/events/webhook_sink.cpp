#include "webhook_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include "event_factory.hpp"
#include "internal/util/errors.hpp"

namespace chunkscribe::events {

WebhookSink::WebhookSink(std::shared_ptr<http::HttpClient> client, std::string url, std::chrono::milliseconds timeout)
    : client_(std::move(client)), url_(std::move(url)), timeout_(timeout) {
}

void WebhookSink::Deliver(const chunkscribe::events::v1::Event& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  http::HttpRequest request;
  request.url     = url_;
  request.timeout = timeout_;
  request.headers = {"Content-Type: application/json", "X-Chunkscribe-Event: " + EventType(event)};

  auto status = google::protobuf::util::MessageToJsonString(event, &request.body, options);
  if (!status.ok()) {
    throw util::NotificationDeliveryError("encode event: " + std::string(status.message()));
  }

  const auto response = client_->Post(request);
  if (response.transport_error != http::TransportError::kNone) {
    throw util::NotificationDeliveryError("webhook " + url_ + ": " + response.transport_message);
  }
  if (!response.Ok()) {
    throw util::NotificationDeliveryError("webhook " + url_ + " answered HTTP " + std::to_string(response.status_code));
  }
}

} // namespace chunkscribe::events
