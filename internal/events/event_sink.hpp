#pragma once

#include <string>

#include "chunkscribe/events/v1/events.pb.h"

namespace chunkscribe::events {

/*
  A downstream consumer of session events.

  Deliver() is called from the notifier's dispatch thread, once per event.
  Implementations report failure by throwing util::NotificationDeliveryError.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Deliver(const chunkscribe::events::v1::Event& event) = 0;

  virtual std::string Name() const = 0;
};

} // namespace chunkscribe::events
