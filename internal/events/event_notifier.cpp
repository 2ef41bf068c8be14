#include "event_notifier.hpp"

#include "event_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkscribe::events {

using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

EventNotifier::EventNotifier(std::vector<std::shared_ptr<EventSink>> sinks) : sinks_(std::move(sinks)) {
}

EventNotifier::~EventNotifier() {
  Stop();
}

void EventNotifier::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&EventNotifier::Run, this);
}

void EventNotifier::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void EventNotifier::Publish(chunkscribe::events::v1::Event event) {
  {
    std::lock_guard lock(mutex_);
    // nothing would ever drain it
    if (!running_ || stopping_) {
      dropped_++;
      CHUNKSCRIBE_LOG_DEBUG("Event dropped, notifier not running",
                            {StringField("event", EventType(event)), IntField("dropped", static_cast<int64_t>(dropped_.load()))});
      return;
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void EventNotifier::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return (queue_.empty() && !dispatching_) || !running_; });
}

void EventNotifier::Run() {
  while (true) {
    chunkscribe::events::v1::Event event;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });

      // drain what was already published before stopping
      if (queue_.empty()) break;

      event = std::move(queue_.front());
      queue_.pop_front();
      dispatching_ = true;
    }

    Dispatch(event);

    {
      std::lock_guard lock(mutex_);
      dispatching_ = false;
    }
    idle_cv_.notify_all();
  }

  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  idle_cv_.notify_all();
}

void EventNotifier::Dispatch(const chunkscribe::events::v1::Event& event) {
  for (const auto& sink : sinks_) {
    try {
      sink->Deliver(event);
      ++delivered_;
    } catch (const util::NotificationDeliveryError& e) {
      ++failed_;
      CHUNKSCRIBE_LOG_WARN("Event delivery failed", {StringField("sink", sink->Name()), StringField("event", EventType(event)),
                                                     StringField("event_id", event.event_id()), StringField("error", e.what())});
    } catch (const std::exception& e) {
      ++failed_;
      CHUNKSCRIBE_LOG_ERROR("Event sink raised unexpected error", {StringField("sink", sink->Name()), StringField("event", EventType(event)),
                                                                   StringField("event_id", event.event_id()), StringField("error", e.what())});
    }
  }
}

} // namespace chunkscribe::events
