#include "internal/cache/artifact_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/fingerprint.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using chunkscribe::cache::Artifact;
using chunkscribe::cache::ArtifactCache;
using chunkscribe::cache::CacheInputs;
using chunkscribe::cache::CachePolicy;
using chunkscribe::cache::Fingerprint;
using chunkscribe::testing::Bytes;

struct Fixture {
  std::shared_ptr<chunkscribe::db::memory::MemoryRepository> repo  = std::make_shared<chunkscribe::db::memory::MemoryRepository>();
  std::shared_ptr<chunkscribe::storage::RamBlobStore>        blobs = std::make_shared<chunkscribe::storage::RamBlobStore>();
  std::shared_ptr<ArtifactCache>                             cache;

  explicit Fixture(CachePolicy policy = {}) {
    cache = std::make_shared<ArtifactCache>(repo, blobs, policy);
  }

  // Index row with a controlled creation time.
  void Plant(const std::string& key, uint64_t created_at_ms, uint64_t size) {
    chunkscribe::db::model::CacheEntryRecord entry;
    entry.key           = key;
    entry.kind          = "test";
    entry.blob_key      = "cache/test/" + key;
    entry.content_type  = "application/octet-stream";
    entry.size_bytes    = size;
    entry.created_at_ms = created_at_ms;
    blobs->Write(entry.blob_key, Bytes(std::string(size, 'x')));

    auto tx = repo->Begin();
    assert(repo->UpsertCacheEntry(*tx, entry));
    tx->Commit();
  }

  bool Has(const std::string& key) {
    auto tx    = repo->Begin();
    auto entry = repo->GetCacheEntry(*tx, key);
    tx->Commit();
    return entry.has_value();
  }
};

std::function<Artifact()> Producing(const std::string& data, std::atomic<int>* calls) {
  return [data, calls] {
    ++*calls;
    return Artifact{Bytes(data), "audio/mpeg", 2.0};
  };
}

void TestFingerprintIsCanonical() {
  const CacheInputs inputs = {{"text", "hello"}, {"voice", "alloy"}};

  const auto key = Fingerprint("tts", inputs);
  assert(key.size() == 64);
  assert(key.find_first_not_of("0123456789abcdef") == std::string::npos);
  assert(key == Fingerprint("tts", {{"voice", "alloy"}, {"text", "hello"}}));

  assert(key != Fingerprint("tts", {{"text", "hello"}, {"voice", "echo"}}));
  assert(key != Fingerprint("stt", inputs));
  // length prefixes keep field boundaries apart
  assert(Fingerprint("k", {{"ab", "c"}}) != Fingerprint("k", {{"a", "bc"}}));
  assert(Fingerprint("k", {{"a", ""}}) != Fingerprint("k", {}));
}

void TestMissThenHit() {
  Fixture          f;
  std::atomic<int> calls{0};
  const CacheInputs inputs = {{"text", "hi"}};

  const auto miss = f.cache->GetOrCompute("tts", inputs, Producing("mp3-bytes", &calls));
  assert(!miss.was_cached);
  assert(miss.entry.key == Fingerprint("tts", inputs));
  assert(miss.entry.blob_key == "cache/tts/" + miss.entry.key);
  assert(miss.entry.size_bytes == 9);
  assert(miss.entry.hit_count == 0);

  const auto hit = f.cache->GetOrCompute("tts", inputs, Producing("other", &calls));
  assert(hit.was_cached);
  assert(hit.entry.key == miss.entry.key);
  assert(hit.entry.hit_count == 1);
  assert(hit.entry.last_hit_at_ms > 0);
  assert(calls == 1);

  const auto read = f.cache->Read(miss.entry.key);
  assert(read.data->ToString() == "mp3-bytes");
  assert(read.entry.content_type == "audio/mpeg");

  const auto stats = f.cache->Stats();
  assert(stats.entries == 1);
  assert(stats.total_bytes == 9);
  assert(stats.total_hits == 1);
}

void TestVanishedBlobIsRecomputed() {
  Fixture          f;
  std::atomic<int> calls{0};
  const CacheInputs inputs = {{"text", "again"}};

  const auto first = f.cache->GetOrCompute("tts", inputs, Producing("v1", &calls));
  f.blobs->Remove(first.entry.blob_key);

  const auto second = f.cache->GetOrCompute("tts", inputs, Producing("v2", &calls));
  assert(!second.was_cached);
  assert(calls == 2);
  assert(f.cache->Read(second.entry.key).data->ToString() == "v2");
}

void TestFailedComputeStoresNothing() {
  Fixture f;

  bool threw = false;
  try {
    f.cache->GetOrCompute("tts", {{"text", "boom"}}, []() -> Artifact { throw std::runtime_error("provider down"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.cache->Stats().entries == 0);
  assert(f.blobs->Count() == 0);
}

void TestReadUnknownKeyIsNotFound() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.cache->Read("deadbeef");
  } catch (const chunkscribe::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentMissesComputeOnce() {
  Fixture          f;
  std::atomic<int> calls{0};
  std::atomic<int> cached{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto lookup = f.cache->GetOrCompute("tts", {{"text", "shared"}}, [&] {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return Artifact{Bytes("shared-audio"), "audio/mpeg", 1.0};
      });
      if (lookup.was_cached) ++cached;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(calls == 1);
  assert(cached == 7);
  assert(f.cache->Stats().entries == 1);
}

void TestCleanupExpiresOldEntries() {
  CachePolicy policy;
  policy.max_age_ms          = 10'000;
  policy.pressure_max_age_ms = 1'000;
  policy.max_total_bytes     = 1'000;
  Fixture f(policy);

  f.Plant("old", 1'000, 10);
  f.Plant("fresh", 95'000, 10);

  const auto report = f.cache->Cleanup(100'000);
  assert(report.expired == 1);
  assert(report.pressure_evicted == 0);
  assert(report.size_evicted == 0);
  assert(report.bytes_freed == 10);
  assert(report.remaining_entries == 1);
  assert(!f.Has("old"));
  assert(f.Has("fresh"));
  assert(!f.blobs->Exists("cache/test/old"));
}

void TestCleanupUnderPressure() {
  CachePolicy policy;
  policy.max_age_ms          = 100'000;
  policy.pressure_max_age_ms = 5'000;
  policy.max_total_bytes     = 25;
  Fixture f(policy);

  // over the limit: the entry past pressure age goes first, then the oldest
  f.Plant("a", 10'000, 10);
  f.Plant("b", 97'000, 10);
  f.Plant("c", 98'000, 10);
  f.Plant("d", 99'000, 10);

  const auto report = f.cache->Cleanup(100'000);
  assert(report.expired == 0);
  assert(report.pressure_evicted == 1);
  assert(report.size_evicted == 1);
  assert(report.Removed() == 2);
  assert(report.remaining_entries == 2);
  assert(report.remaining_bytes == 20);

  assert(!f.Has("a"));
  assert(!f.Has("b"));
  assert(f.Has("c"));
  assert(f.Has("d"));
}

void TestCleanupUnderLimitKeepsEverything() {
  Fixture f;
  f.Plant("small", 1'000, 10);

  const auto report = f.cache->Cleanup(2'000);
  assert(report.Removed() == 0);
  assert(f.Has("small"));

  f.cache->NoteWorkCompleted();
}

} // namespace

int main() {
  TestFingerprintIsCanonical();
  TestMissThenHit();
  TestVanishedBlobIsRecomputed();
  TestFailedComputeStoresNothing();
  TestReadUnknownKeyIsNotFound();
  TestConcurrentMissesComputeOnce();
  TestCleanupExpiresOldEntries();
  TestCleanupUnderPressure();
  TestCleanupUnderLimitKeepsEverything();

  std::cout << "chunkscribe_unit_artifact_cache: pass\n";
  return 0;
}
