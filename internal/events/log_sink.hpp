#pragma once

#include "event_sink.hpp"

namespace chunkscribe::events {

// Writes one structured log line per event.
class LogSink final : public EventSink {
 public:
  void Deliver(const chunkscribe::events::v1::Event& event) override;

  std::string Name() const override {
    return "log";
  }
};

} // namespace chunkscribe::events
