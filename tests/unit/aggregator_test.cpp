#include "internal/aggregate/aggregator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace chunkscribe::core::v1;
using chunkscribe::aggregate::Aggregator;
using chunkscribe::aggregate::MergeWithOverlap;
using chunkscribe::aggregate::OverlapPolicy;
using chunkscribe::testing::MakeChunk;
using chunkscribe::testing::MakeSegment;
using chunkscribe::testing::MakeSession;
using chunkscribe::testing::Near;
using chunkscribe::testing::Seed;

void TestMergeDropsRepeatedWords() {
  assert(MergeWithOverlap("hello there", "there, how are you", 50) == "hello there, how are you");
  assert(MergeWithOverlap("we met in the city", "in the city centre", 50) == "we met in the city centre");
}

void TestMergeWithoutOverlapJoinsWithSpace() {
  assert(MergeWithOverlap("good morning", "how are you", 50) == "good morning how are you");
  assert(MergeWithOverlap("", "first words", 50) == "first words");
  assert(MergeWithOverlap("last words", "", 50) == "last words");
}

void TestMergeIgnoresPartialWords() {
  // "cat" is a prefix of "catalog", not a repeated word
  assert(MergeWithOverlap("the cat", "catalog of items", 50) == "the cat catalog of items");
}

void TestMergeRespectsWindow() {
  assert(MergeWithOverlap("hello there", "there you go", 3) == "hello there there you go");
  assert(MergeWithOverlap("hello there", "there you go", 0) == "hello there there you go");
}

void TestMergeIgnoresPunctuationOnlyOverlap() {
  assert(MergeWithOverlap("wait.", ". then", 50) == "wait. . then");
}

void TestMergeRemovesFullWindowOverlap() {
  const std::string shared = "the answer is that teams should ship small changes";
  assert(shared.size() == 50);
  assert(MergeWithOverlap("looking back, " + shared, shared + " every single week", 50) ==
         "looking back, " + shared + " every single week");

  // the chunk boundary cut a word; a full-window match still counts
  const std::string spoken = "our teams rely on interdependent services that ship small, frequent changes";
  const std::string tail   = spoken.substr(spoken.size() - 50);
  assert(tail.rfind("pendent", 0) == 0);
  assert(MergeWithOverlap(spoken, tail + " every sprint", 50) == spoken + " every sprint");
  // one character short of the window, the cut word blocks the match
  assert(MergeWithOverlap(spoken, tail + " every sprint", 49) == spoken + " " + tail + " every sprint");
}

void TestAggregateRemovesTwoSecondOverlap() {
  Aggregator aggregator(nullptr, OverlapPolicy{});

  const std::string shared = "the answer is that teams should ship small changes";
  auto              first  = MakeChunk("s5", 0, TRANSCRIPTION_STATUS_COMPLETED, "looking back, " + shared, 0.8);
  auto              second = MakeChunk("s5", 1, TRANSCRIPTION_STATUS_COMPLETED, shared + " every single week", 0.6);
  second.overlap_seconds   = 2.0;

  const auto result = aggregator.AggregateChunks("s5", {first, second});
  assert(result.full_transcript() == "looking back, " + shared + " every single week");
}

void TestWindowFromOverlapSeconds() {
  OverlapPolicy policy;
  assert(policy.WindowFor(0.0) == 0);
  assert(policy.WindowFor(-1.0) == 0);
  assert(policy.WindowFor(1.0) == 25);
  assert(policy.WindowFor(0.5) == 13);
  assert(policy.WindowFor(2.0) == 50);
  assert(policy.WindowFor(30.0) == 50);

  policy.char_budget = 20;
  assert(policy.WindowFor(1.0) == 20);
}

void TestAggregateOrdersMergesAndAverages() {
  auto       repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  Aggregator aggregator(repo, OverlapPolicy{});

  auto first = MakeChunk("s1", 0, TRANSCRIPTION_STATUS_COMPLETED, "hello there", 0.9);
  first.segments.push_back(MakeSegment(0.0, 1.2, "hello there", 0.9));
  auto second = MakeChunk("s1", 1, TRANSCRIPTION_STATUS_COMPLETED, "  there, how are you ", 0.6);
  second.segments.push_back(MakeSegment(0.0, 2.0, "there, how are you", 0.6));
  auto third = MakeChunk("s1", 2, TRANSCRIPTION_STATUS_FAILED);

  // insertion order must not matter
  Seed(*repo, MakeSession("s1", SESSION_STATUS_RECEIVING, 3), {third, second, first});

  const auto result = aggregator.Aggregate("s1");
  assert(result.session_id() == "s1");
  assert(result.full_transcript() == "hello there, how are you");
  assert(result.total_chunks() == 3);
  assert(result.completed_chunks() == 2);
  assert(result.failed_chunks() == 1);
  assert(Near(result.confidence_score(), 0.75));
  assert(Near(result.duration_seconds(), 15.0));

  assert(result.segments_size() == 2);
  assert(result.segments(0).sequence_index() == 0);
  assert(result.segments(1).sequence_index() == 1);
  // segment times stay relative to their chunk
  assert(Near(result.segments(1).start_seconds(), 0.0));
}

void TestPendingChunksCountButContributeNothing() {
  Aggregator aggregator(nullptr, OverlapPolicy{});

  std::vector<chunkscribe::db::model::ChunkRecord> chunks = {
      MakeChunk("s2", 0, TRANSCRIPTION_STATUS_COMPLETED, "only this", 0.8),
      MakeChunk("s2", 1, TRANSCRIPTION_STATUS_PENDING),
      MakeChunk("s2", 2, TRANSCRIPTION_STATUS_PROCESSING),
  };

  const auto result = aggregator.AggregateChunks("s2", chunks);
  assert(result.full_transcript() == "only this");
  assert(result.total_chunks() == 3);
  assert(result.completed_chunks() == 1);
  assert(result.failed_chunks() == 0);
  assert(Near(result.confidence_score(), 0.8));
}

void TestNothingCompletedYieldsEmptyTranscript() {
  Aggregator aggregator(nullptr, OverlapPolicy{});

  const auto result = aggregator.AggregateChunks("s3", {MakeChunk("s3", 0, TRANSCRIPTION_STATUS_FAILED)});
  assert(result.full_transcript().empty());
  assert(result.confidence_score() == 0.0);
  assert(result.failed_chunks() == 1);
}

void TestZeroOverlapNeverMerges() {
  Aggregator aggregator(nullptr, OverlapPolicy{});

  auto first  = MakeChunk("s4", 0, TRANSCRIPTION_STATUS_COMPLETED, "so so", 1.0);
  auto second = MakeChunk("s4", 1, TRANSCRIPTION_STATUS_COMPLETED, "so what", 1.0);
  second.overlap_seconds = 0.0;

  const auto result = aggregator.AggregateChunks("s4", {first, second});
  assert(result.full_transcript() == "so so so what");
}

void TestUnknownSessionIsNotFound() {
  auto       repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  Aggregator aggregator(repo, OverlapPolicy{});

  bool threw = false;
  try {
    (void)aggregator.Aggregate("missing");
  } catch (const chunkscribe::util::NotFound&) {
    threw = true;
  }
  assert(threw && "aggregating a session without chunks must fail");
}

} // namespace

int main() {
  TestMergeDropsRepeatedWords();
  TestMergeWithoutOverlapJoinsWithSpace();
  TestMergeIgnoresPartialWords();
  TestMergeRespectsWindow();
  TestMergeIgnoresPunctuationOnlyOverlap();
  TestMergeRemovesFullWindowOverlap();
  TestAggregateRemovesTwoSecondOverlap();
  TestWindowFromOverlapSeconds();
  TestAggregateOrdersMergesAndAverages();
  TestPendingChunksCountButContributeNothing();
  TestNothingCompletedYieldsEmptyTranscript();
  TestZeroOverlapNeverMerges();
  TestUnknownSessionIsNotFound();

  std::cout << "chunkscribe_unit_aggregator: pass\n";
  return 0;
}
