#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "fingerprint.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace chunkscribe::cache {

struct CachePolicy {
  uint64_t max_age_ms          = 24ull * 3600 * 1000;
  uint64_t pressure_max_age_ms = 3600ull * 1000;
  uint64_t max_total_bytes     = 512ull * 1024 * 1024;

  static CachePolicy FromConfig(const chunkscribe::runtime::config::CacheConfig& config);
};

// What a compute function produces on a miss.
struct Artifact {
  std::shared_ptr<arrow::Buffer> data;
  std::string                    content_type;
  double                         duration_seconds = 0.0;
};

struct CacheLookup {
  db::model::CacheEntryRecord entry;
  bool                        was_cached = false;
};

struct CachedArtifact {
  db::model::CacheEntryRecord    entry;
  std::shared_ptr<arrow::Buffer> data;
};

struct CleanupReport {
  size_t   expired          = 0;
  size_t   pressure_evicted = 0;
  size_t   size_evicted     = 0;
  uint64_t bytes_freed      = 0;

  size_t   remaining_entries = 0;
  uint64_t remaining_bytes   = 0;

  size_t Removed() const {
    return expired + pressure_evicted + size_evicted;
  }
};

struct CacheStats {
  uint64_t entries     = 0;
  uint64_t total_bytes = 0;
  uint64_t total_hits  = 0;
};

/*
  Content-addressed artifact cache.

  Index rows live in the repository, bytes in the blob store under
  "cache/<kind>/<fingerprint>". Identical inputs always map to the same
  key; concurrent misses for one key compute once.
*/
class ArtifactCache {
 public:
  ArtifactCache(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, CachePolicy policy);

  // On a hit increments hit_count and last_hit_at_ms. An entry whose blob
  // vanished counts as a miss and is replaced.
  CacheLookup GetOrCompute(const std::string& kind, const CacheInputs& inputs, const std::function<Artifact()>& compute);

  // Throws util::NotFound for unknown keys or missing bytes.
  CachedArtifact Read(const std::string& key);

  /*
    Eviction, in order:
      1. entries older than max_age
      2. when over max_total_bytes: entries older than pressure_max_age
      3. when still over: oldest first until under the limit
  */
  CleanupReport Cleanup(uint64_t now_ms);

  // Opportunistic cleanup hook; never throws.
  void NoteWorkCompleted();

  CacheStats Stats();

  const CachePolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  storage::StorageBackendPtr      blobs_;
  CachePolicy                     policy_;

  util::KeyedMutex flights_;

  std::mutex cleanup_mutex_;
};

} // namespace chunkscribe::cache
