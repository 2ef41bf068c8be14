#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "event_sink.hpp"

namespace chunkscribe::events {

/*
  Fire-and-forget event fan-out.

  Publish() only enqueues; a single dispatch thread hands each event to
  every sink exactly once. Events published while the notifier is not
  running are dropped. A sink failure is logged and dropped, so no
  publisher ever observes delivery errors (at-most-once, no redelivery).
*/
class EventNotifier {
 public:
  explicit EventNotifier(std::vector<std::shared_ptr<EventSink>> sinks);
  ~EventNotifier();

  EventNotifier(const EventNotifier&)            = delete;
  EventNotifier& operator=(const EventNotifier&) = delete;

  void Start();
  void Stop();

  void Publish(chunkscribe::events::v1::Event event);

  // Blocks until every published event was handed to all sinks.
  void WaitIdle();

  uint64_t Delivered() const {
    return delivered_.load();
  }
  uint64_t Failed() const {
    return failed_.load();
  }
  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Run();
  void Dispatch(const chunkscribe::events::v1::Event& event);

  std::vector<std::shared_ptr<EventSink>> sinks_;

  std::mutex                                 mutex_;
  std::condition_variable                    cv_;
  std::condition_variable                    idle_cv_;
  std::deque<chunkscribe::events::v1::Event> queue_;
  bool                                       dispatching_ = false;
  bool                                       stopping_    = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace chunkscribe::events
