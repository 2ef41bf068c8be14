#include "internal/events/event_notifier.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/events/event_factory.hpp"
#include "internal/events/log_sink.hpp"
#include "internal/events/webhook_sink.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using chunkscribe::events::EventNotifier;
using chunkscribe::events::EventSink;
using chunkscribe::events::v1::Event;
using chunkscribe::testing::MakeChunk;
using chunkscribe::testing::RecordingSink;

class FailingSink final : public EventSink {
 public:
  void Deliver(const Event&) override {
    throw chunkscribe::util::NotificationDeliveryError("endpoint answered 500");
  }
  std::string Name() const override {
    return "failing";
  }
};

class ThrowingSink final : public EventSink {
 public:
  void Deliver(const Event&) override {
    throw std::logic_error("bug in sink");
  }
  std::string Name() const override {
    return "throwing";
  }
};

Event Completed(const std::string& session_id) {
  chunkscribe::core::v1::AggregatedTranscript transcript;
  transcript.set_session_id(session_id);
  transcript.set_full_transcript("all done");
  return chunkscribe::events::MakeSessionCompleted(transcript);
}

void TestEveryEventReachesEverySink() {
  auto first  = std::make_shared<RecordingSink>();
  auto second = std::make_shared<RecordingSink>();

  EventNotifier notifier({first, second});
  notifier.Start();

  notifier.Publish(chunkscribe::events::MakeChunkUploaded(MakeChunk("s1", 0, chunkscribe::core::v1::TRANSCRIPTION_STATUS_PENDING), false));
  notifier.Publish(Completed("s1"));
  notifier.WaitIdle();

  assert(first->Events().size() == 2);
  assert(second->Events().size() == 2);
  assert(first->Events()[0].chunk_uploaded().chunk_id() == "s1-chunk-0");
  assert(first->Events()[1].session_completed().transcript().full_transcript() == "all done");
  assert(notifier.Delivered() == 4);
  assert(notifier.Failed() == 0);

  notifier.Stop();
}

void TestSinkFailuresAreContained() {
  auto recording = std::make_shared<RecordingSink>();

  EventNotifier notifier({std::make_shared<FailingSink>(), std::make_shared<ThrowingSink>(), recording});
  notifier.Start();

  // publishers never see delivery errors
  notifier.Publish(Completed("s2"));
  notifier.Publish(chunkscribe::events::MakeSessionFailed("s3", "no chunk produced a transcript", 2));
  notifier.WaitIdle();

  assert(recording->Events().size() == 2);
  assert(notifier.Delivered() == 2);
  assert(notifier.Failed() == 4);

  notifier.Stop();
}

void TestStopDrainsPublishedEvents() {
  auto recording = std::make_shared<RecordingSink>();

  EventNotifier notifier({recording});
  notifier.Start();
  for (int i = 0; i < 5; ++i) {
    notifier.Publish(Completed("s" + std::to_string(i)));
  }
  notifier.Stop();

  assert(recording->Events().size() == 5);
  assert(recording->Events()[4].session_completed().session_id() == "s4");

  // idle wait on a stopped notifier returns immediately
  notifier.WaitIdle();
}

void TestEventsOutsideRunningWindowAreDropped() {
  auto recording = std::make_shared<RecordingSink>();

  EventNotifier notifier({recording});
  // no dispatch thread yet
  notifier.Publish(Completed("early"));
  assert(notifier.Dropped() == 1);

  notifier.Start();
  notifier.Publish(Completed("on-time"));
  notifier.Stop();

  // dispatch thread is gone
  notifier.Publish(Completed("late-1"));
  notifier.Publish(Completed("late-2"));

  assert(notifier.Dropped() == 3);
  assert(notifier.Delivered() == 1);
  assert(recording->Events().size() == 1);
  assert(recording->Events()[0].session_completed().session_id() == "on-time");

  // a restarted notifier only sees new events
  notifier.Start();
  notifier.Publish(Completed("restarted"));
  notifier.Stop();
  assert(recording->Events().size() == 2);
  assert(recording->Events()[1].session_completed().session_id() == "restarted");
}

void TestEventFactory() {
  using chunkscribe::events::EventType;

  auto       chunk   = MakeChunk("s5", 3, chunkscribe::core::v1::TRANSCRIPTION_STATUS_PENDING);
  chunk.question_id  = "q-1";
  const auto uploaded = chunkscribe::events::MakeChunkUploaded(chunk, true);
  assert(EventType(uploaded) == "chunk_uploaded");
  assert(!uploaded.event_id().empty());
  assert(uploaded.emitted_at_ms() > 0);
  assert(uploaded.chunk_uploaded().sequence_index() == 3);
  assert(uploaded.chunk_uploaded().question_id() == "q-1");
  assert(uploaded.chunk_uploaded().size_bytes() == 16);
  assert(uploaded.chunk_uploaded().overwrote_existing());

  const auto completed = Completed("s5");
  assert(EventType(completed) == "session_completed");
  assert(completed.session_completed().session_id() == "s5");
  assert(completed.event_id() != uploaded.event_id());

  const auto failed = chunkscribe::events::MakeSessionFailed("s5", "no chunks were uploaded", 0);
  assert(EventType(failed) == "session_failed");
  assert(failed.session_failed().reason() == "no chunks were uploaded");

  assert(EventType(Event{}) == "unknown");
}

void TestLogSinkAcceptsEveryEvent() {
  chunkscribe::events::LogSink sink;
  sink.Deliver(Completed("s6"));
  sink.Deliver(chunkscribe::events::MakeSessionFailed("s6", "forced", 1));
  assert(sink.Name() == "log");
}

void TestWebhookFailureIsDeliveryError() {
  chunkscribe::events::WebhookSink sink(std::make_shared<chunkscribe::http::HttpClient>(), "http://127.0.0.1:1/hooks",
                                        std::chrono::milliseconds(500));
  assert(sink.Name() == "webhook:http://127.0.0.1:1/hooks");

  bool threw = false;
  try {
    sink.Deliver(Completed("s7"));
  } catch (const chunkscribe::util::NotificationDeliveryError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEveryEventReachesEverySink();
  TestSinkFailuresAreContained();
  TestStopDrainsPublishedEvents();
  TestEventsOutsideRunningWindowAreDropped();
  TestEventFactory();
  TestLogSinkAcceptsEveryEvent();
  TestWebhookFailureIsDeliveryError();

  std::cout << "chunkscribe_unit_event_notifier: pass\n";
  return 0;
}
