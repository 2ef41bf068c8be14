#include "internal/chunk/gap_detector.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "test_support.hpp"

namespace {

using namespace chunkscribe::core::v1;
using chunkscribe::chunk::GapDetector;
using chunkscribe::testing::MakeChunk;
using chunkscribe::testing::MakeSession;
using chunkscribe::testing::Seed;

using Indices = std::vector<uint32_t>;

void TestComputeGaps() {
  assert(GapDetector::ComputeGaps({}) == Indices{});
  assert(GapDetector::ComputeGaps({0, 1, 2}) == Indices{});
  assert((GapDetector::ComputeGaps({0, 1, 3, 6}) == Indices{2, 4, 5}));
  assert(GapDetector::ComputeGaps({2}).empty());
  assert((GapDetector::ComputeGaps({3, 4, 6}) == Indices{5}));
}

void TestFindGapsOnlyLooksBelowHighestIndex() {
  auto        repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  GapDetector detector(repo);

  // total says 10, but indices past 4 may simply not have been recorded yet
  Seed(*repo, MakeSession("interview", SESSION_STATUS_RECEIVING, 10),
       {MakeChunk("interview", 0, TRANSCRIPTION_STATUS_COMPLETED, "a", 1.0), MakeChunk("interview", 2, TRANSCRIPTION_STATUS_PENDING),
        MakeChunk("interview", 4, TRANSCRIPTION_STATUS_FAILED)});

  assert((detector.FindGaps("interview") == Indices{1, 3}));
  assert(detector.FindGaps("unknown").empty());
}

void TestFindGapsStartsAtLowestStoredIndex() {
  auto        repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  GapDetector detector(repo);

  // recording joined late; nothing below index 3 was ever sent
  Seed(*repo, MakeSession("late-start", SESSION_STATUS_RECEIVING),
       {MakeChunk("late-start", 3, TRANSCRIPTION_STATUS_PENDING), MakeChunk("late-start", 4, TRANSCRIPTION_STATUS_PENDING),
        MakeChunk("late-start", 6, TRANSCRIPTION_STATUS_PENDING)});

  assert((detector.FindGaps("late-start") == Indices{5}));
}

void TestSweepReportsOnlyReceivingSessionsWithGaps() {
  auto        repo = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  GapDetector detector(repo);

  Seed(*repo, MakeSession("gappy", SESSION_STATUS_RECEIVING),
       {MakeChunk("gappy", 0, TRANSCRIPTION_STATUS_PENDING), MakeChunk("gappy", 3, TRANSCRIPTION_STATUS_PENDING)});
  Seed(*repo, MakeSession("complete-set", SESSION_STATUS_RECEIVING),
       {MakeChunk("complete-set", 0, TRANSCRIPTION_STATUS_PENDING), MakeChunk("complete-set", 1, TRANSCRIPTION_STATUS_PENDING)});
  Seed(*repo, MakeSession("late-only", SESSION_STATUS_RECEIVING), {MakeChunk("late-only", 2, TRANSCRIPTION_STATUS_PENDING)});
  Seed(*repo, MakeSession("finished", SESSION_STATUS_COMPLETED),
       {MakeChunk("finished", 0, TRANSCRIPTION_STATUS_COMPLETED, "x", 1.0), MakeChunk("finished", 2, TRANSCRIPTION_STATUS_COMPLETED, "x", 1.0)});

  const auto report = detector.SweepActiveSessions();
  assert(report.size() == 1);
  assert(report.count("gappy") == 1);
  assert((report.at("gappy") == Indices{1, 2}));
}

} // namespace

int main() {
  TestComputeGaps();
  TestFindGapsOnlyLooksBelowHighestIndex();
  TestFindGapsStartsAtLowestStoredIndex();
  TestSweepReportsOnlyReceivingSessionsWithGaps();

  std::cout << "chunkscribe_unit_gap_detector: pass\n";
  return 0;
}
