#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "event_sink.hpp"
#include "internal/http/http_client.hpp"

namespace chunkscribe::events {

/*
  POSTs each event as JSON (proto3 JSON mapping of v1::Event) to a URL.
  Any transport error or non-2xx answer is a NotificationDeliveryError.
*/
class WebhookSink final : public EventSink {
 public:
  WebhookSink(std::shared_ptr<http::HttpClient> client, std::string url, std::chrono::milliseconds timeout);

  void Deliver(const chunkscribe::events::v1::Event& event) override;

  std::string Name() const override {
    return "webhook:" + url_;
  }

 private:
  std::shared_ptr<http::HttpClient> client_;
  std::string                       url_;
  std::chrono::milliseconds         timeout_;
};

} // namespace chunkscribe::events
