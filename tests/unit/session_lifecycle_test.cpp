#include "internal/session/session_lifecycle.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/aggregate/aggregator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/model/session_state.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace chunkscribe::core::v1;
using chunkscribe::events::v1::Event;
using chunkscribe::session::SessionLifecycle;
using chunkscribe::testing::LoadSession;
using chunkscribe::testing::MakeChunk;
using chunkscribe::testing::MakeSession;
using chunkscribe::testing::Near;
using chunkscribe::testing::RecordingSink;
using chunkscribe::testing::Seed;

struct Fixture {
  std::shared_ptr<chunkscribe::db::memory::MemoryRepository> repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  std::shared_ptr<RecordingSink>                             sink = std::make_shared<RecordingSink>();
  std::shared_ptr<chunkscribe::events::EventNotifier>        notifier;
  std::shared_ptr<SessionLifecycle>                          lifecycle;

  Fixture() {
    notifier = std::make_shared<chunkscribe::events::EventNotifier>(std::vector<std::shared_ptr<chunkscribe::events::EventSink>>{sink});
    notifier->Start();
    auto aggregator = std::make_shared<chunkscribe::aggregate::Aggregator>(repo, chunkscribe::aggregate::OverlapPolicy{});
    lifecycle       = std::make_shared<SessionLifecycle>(repo, aggregator, notifier);
  }

  ~Fixture() {
    notifier->Stop();
  }

  size_t Events(Event::BodyCase body) {
    notifier->WaitIdle();
    return sink->Count(body);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestStateMachine() {
  using chunkscribe::model::CanTransition;
  assert(CanTransition(SESSION_STATUS_OPEN, SESSION_STATUS_RECEIVING));
  assert(CanTransition(SESSION_STATUS_RECEIVING, SESSION_STATUS_COMPLETED));
  assert(CanTransition(SESSION_STATUS_OPEN, SESSION_STATUS_FAILED));
  assert(CanTransition(SESSION_STATUS_RECEIVING, SESSION_STATUS_FAILED));
  assert(!CanTransition(SESSION_STATUS_OPEN, SESSION_STATUS_COMPLETED));
  assert(!CanTransition(SESSION_STATUS_COMPLETED, SESSION_STATUS_RECEIVING));
  assert(!CanTransition(SESSION_STATUS_FAILED, SESSION_STATUS_COMPLETED));
  assert(!CanTransition(SESSION_STATUS_COMPLETED, SESSION_STATUS_COMPLETED));
}

void TestOpenSessionIsIdempotent() {
  Fixture f;

  const auto opened = f.lifecycle->OpenSession("s1", std::nullopt);
  assert(opened.status == SESSION_STATUS_OPEN);
  assert(!opened.total_chunks_expected.has_value());

  const auto again = f.lifecycle->OpenSession("s1", 4u);
  assert(again.status == SESSION_STATUS_OPEN);
  assert(again.total_chunks_expected == 4u);
  assert(again.created_at_ms == opened.created_at_ms);

  assert(Throws<chunkscribe::util::ValidationError>([&] { f.lifecycle->OpenSession("s1", 0u); }));
  assert(Throws<chunkscribe::util::ValidationError>([&] { f.lifecycle->OpenSession("bad/id", std::nullopt); }));
}

void TestCompletionWaitsForLastChunkAndInFlightWork() {
  Fixture f;

  // no total known yet
  Seed(*f.repo, MakeSession("s2", SESSION_STATUS_RECEIVING), {MakeChunk("s2", 0, TRANSCRIPTION_STATUS_COMPLETED, "hello there", 0.9)});
  assert(!f.lifecycle->EvaluateCompletion("s2").has_value());

  // last chunk missing
  Seed(*f.repo, MakeSession("s2", SESSION_STATUS_RECEIVING, 3),
       {MakeChunk("s2", 1, TRANSCRIPTION_STATUS_COMPLETED, "there, how are you", 0.6)});
  assert(!f.lifecycle->EvaluateCompletion("s2").has_value());

  // last chunk present but still being transcribed
  Seed(*f.repo, MakeSession("s2", SESSION_STATUS_RECEIVING, 3), {MakeChunk("s2", 2, TRANSCRIPTION_STATUS_PROCESSING)});
  assert(!f.lifecycle->EvaluateCompletion("s2").has_value());

  Seed(*f.repo, MakeSession("s2", SESSION_STATUS_RECEIVING, 3), {MakeChunk("s2", 2, TRANSCRIPTION_STATUS_FAILED)});
  const auto outcome = f.lifecycle->EvaluateCompletion("s2");
  assert(outcome.has_value());
  assert(outcome->session.status == SESSION_STATUS_COMPLETED);
  assert(outcome->session.completed_at_ms > 0);
  assert(outcome->transcript->full_transcript() == "hello there, how are you");
  assert(outcome->transcript->completed_chunks() == 2);
  assert(outcome->transcript->failed_chunks() == 1);
  assert(Near(outcome->transcript->confidence_score(), 0.75));

  // exactly one transition and one event
  assert(!f.lifecycle->EvaluateCompletion("s2").has_value());
  assert(f.Events(Event::kSessionCompleted) == 1);

  const auto events = f.sink->Events();
  assert(events.back().session_completed().transcript().full_transcript() == "hello there, how are you");

  const auto transcript = f.lifecycle->GetTranscript("s2");
  assert(transcript.status == SESSION_STATUS_COMPLETED);
  assert(transcript.transcript.full_transcript() == "hello there, how are you");
}

void TestGapsDoNotBlockCompletion() {
  Fixture f;

  Seed(*f.repo, MakeSession("s3", SESSION_STATUS_RECEIVING, 3),
       {MakeChunk("s3", 0, TRANSCRIPTION_STATUS_COMPLETED, "first", 1.0), MakeChunk("s3", 2, TRANSCRIPTION_STATUS_COMPLETED, "third", 1.0)});

  const auto outcome = f.lifecycle->EvaluateCompletion("s3");
  assert(outcome.has_value());
  assert(outcome->transcript->total_chunks() == 2);
  assert(outcome->transcript->full_transcript() == "first third");
}

void TestNoTranscribedChunkFailsTheSession() {
  Fixture f;

  Seed(*f.repo, MakeSession("s4", SESSION_STATUS_RECEIVING, 2),
       {MakeChunk("s4", 0, TRANSCRIPTION_STATUS_FAILED), MakeChunk("s4", 1, TRANSCRIPTION_STATUS_FAILED)});

  const auto outcome = f.lifecycle->EvaluateCompletion("s4");
  assert(outcome.has_value());
  assert(outcome->session.status == SESSION_STATUS_FAILED);
  assert(outcome->session.failure_reason == "no chunk produced a transcript");
  assert(!outcome->transcript.has_value());

  assert(f.Events(Event::kSessionFailed) == 1);
  assert(f.sink->Events().back().session_failed().total_chunks() == 2);
}

void TestFinalizeForcesSettlement() {
  Fixture f;

  Seed(*f.repo, MakeSession("s5", SESSION_STATUS_RECEIVING),
       {MakeChunk("s5", 0, TRANSCRIPTION_STATUS_COMPLETED, "partial answer", 0.5), MakeChunk("s5", 3, TRANSCRIPTION_STATUS_PENDING)});

  const auto outcome = f.lifecycle->FinalizeSession("s5");
  assert(outcome.session.status == SESSION_STATUS_COMPLETED);
  assert(outcome.transcript->full_transcript() == "partial answer");

  assert(Throws<chunkscribe::util::Conflict>([&] { f.lifecycle->FinalizeSession("s5"); }));
  assert(Throws<chunkscribe::util::NotFound>([&] { f.lifecycle->FinalizeSession("nobody"); }));

  // settled and unknown sessions leave no per-session lock behind
  assert(f.lifecycle->LockedSessionCount() == 0);
}

void TestFinalizeEmptySessionFails() {
  Fixture f;
  f.lifecycle->OpenSession("s6", std::nullopt);

  const auto outcome = f.lifecycle->FinalizeSession("s6");
  assert(outcome.session.status == SESSION_STATUS_FAILED);
  assert(outcome.session.failure_reason == "no chunks were uploaded");
  assert(LoadSession(*f.repo, "s6")->status == SESSION_STATUS_FAILED);
}

void TestLateTotalTriggersCompletion() {
  Fixture f;

  Seed(*f.repo, MakeSession("s7", SESSION_STATUS_RECEIVING),
       {MakeChunk("s7", 0, TRANSCRIPTION_STATUS_COMPLETED, "a", 1.0), MakeChunk("s7", 1, TRANSCRIPTION_STATUS_COMPLETED, "b", 1.0)});

  const auto session = f.lifecycle->OpenSession("s7", 2u);
  assert(session.status == SESSION_STATUS_COMPLETED);
  assert(f.Events(Event::kSessionCompleted) == 1);
}

void TestLiveTranscriptBeforeCompletion() {
  Fixture f;

  Seed(*f.repo, MakeSession("s8", SESSION_STATUS_RECEIVING, 5), {MakeChunk("s8", 0, TRANSCRIPTION_STATUS_COMPLETED, "so far", 0.7)});

  const auto live = f.lifecycle->GetTranscript("s8");
  assert(live.status == SESSION_STATUS_RECEIVING);
  assert(live.transcript.full_transcript() == "so far");

  assert(Throws<chunkscribe::util::NotFound>([&] { f.lifecycle->GetTranscript("nobody"); }));
}

void TestDescriptors() {
  auto session            = MakeSession("s9", SESSION_STATUS_COMPLETED, 3);
  session.completed_at_ms = 5'000;
  const auto described    = chunkscribe::session::ToDescriptor(session);
  assert(described.session_id() == "s9");
  assert(described.total_chunks_expected() == 3);
  assert(described.completed_at_ms() == 5'000);

  const auto pending = chunkscribe::session::ToDescriptor(MakeChunk("s9", 1, TRANSCRIPTION_STATUS_PENDING));
  assert(!pending.has_transcript_text());
  const auto done = chunkscribe::session::ToDescriptor(MakeChunk("s9", 0, TRANSCRIPTION_STATUS_COMPLETED, "text", 0.5));
  assert(done.transcript_text() == "text");
}

} // namespace

int main() {
  TestStateMachine();
  TestOpenSessionIsIdempotent();
  TestCompletionWaitsForLastChunkAndInFlightWork();
  TestGapsDoNotBlockCompletion();
  TestNoTranscribedChunkFailsTheSession();
  TestFinalizeForcesSettlement();
  TestFinalizeEmptySessionFails();
  TestLateTotalTriggersCompletion();
  TestLiveTranscriptBeforeCompletion();
  TestDescriptors();

  std::cout << "chunkscribe_unit_session_lifecycle: pass\n";
  return 0;
}
