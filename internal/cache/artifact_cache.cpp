#include "artifact_cache.hpp"

#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chunkscribe::cache {

using chunkscribe::db::ThrowIfDbError;
using chunkscribe::observability::IntField;
using chunkscribe::observability::StringField;

CachePolicy CachePolicy::FromConfig(const chunkscribe::runtime::config::CacheConfig& config) {
  CachePolicy policy;
  policy.max_age_ms          = config.max_age_seconds() * 1000;
  policy.pressure_max_age_ms = config.pressure_max_age_seconds() * 1000;
  policy.max_total_bytes     = config.max_total_bytes();
  return policy;
}

ArtifactCache::ArtifactCache(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, CachePolicy policy)
    : repository_(std::move(repository)), blobs_(std::move(blobs)), policy_(policy) {
}

CacheLookup ArtifactCache::GetOrCompute(const std::string& kind, const CacheInputs& inputs, const std::function<Artifact()>& compute) {
  const std::string key = Fingerprint(kind, inputs);

  // concurrent misses on one key compute once
  auto flight_lock = flights_.Lock(key);

  // ------------------------------------------------------------------
  // Hit path
  // ------------------------------------------------------------------
  std::string stale_blob;
  {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetCacheEntry(*tx, key);
    if (entry && blobs_->Exists(entry->blob_key)) {
      entry->hit_count += 1;
      entry->last_hit_at_ms = util::NowMillis();
      ThrowIfDbError(repository_->UpsertCacheEntry(*tx, *entry), "record cache hit");
      tx->Commit();

      CHUNKSCRIBE_LOG_DEBUG("Cache hit", {StringField("kind", kind), StringField("key", key), IntField("hits", static_cast<int64_t>(entry->hit_count))});
      return {*entry, true};
    }
    if (entry) {
      CHUNKSCRIBE_LOG_WARN("Cache entry lost its blob; recomputing", {StringField("key", key), StringField("blob_key", entry->blob_key)});
      ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "drop stale cache entry");
      tx->Commit();
    } else {
      tx->Rollback();
    }
  }

  // ------------------------------------------------------------------
  // Miss: compute outside any transaction
  // ------------------------------------------------------------------
  Artifact artifact = compute();
  if (!artifact.data) {
    throw std::runtime_error("cache compute for '" + kind + "' produced no data");
  }

  const auto                  now = util::NowMillis();
  db::model::CacheEntryRecord entry;
  entry.key              = key;
  entry.kind             = kind;
  entry.blob_key         = "cache/" + kind + "/" + key;
  entry.content_type     = artifact.content_type;
  entry.size_bytes       = static_cast<uint64_t>(artifact.data->size());
  entry.duration_seconds = artifact.duration_seconds;
  entry.created_at_ms    = now;
  entry.last_hit_at_ms   = 0;
  entry.hit_count        = 0;

  blobs_->Write(entry.blob_key, artifact.data);
  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertCacheEntry(*tx, entry), "insert cache entry");
    tx->Commit();
  } catch (...) {
    blobs_->Remove(entry.blob_key);
    throw;
  }

  CHUNKSCRIBE_LOG_INFO("Cache miss stored", {StringField("kind", kind), StringField("key", key), IntField("size_bytes", static_cast<int64_t>(entry.size_bytes))});
  return {entry, false};
}

CachedArtifact ArtifactCache::Read(const std::string& key) {
  std::optional<db::model::CacheEntryRecord> entry;
  {
    auto tx = repository_->Begin();
    entry   = repository_->GetCacheEntry(*tx, key);
    tx->Commit();
  }
  if (!entry) {
    throw util::NotFound("cache entry " + key + " not found");
  }
  return {*entry, blobs_->Read(entry->blob_key)};
}

CleanupReport ArtifactCache::Cleanup(uint64_t now_ms) {
  std::lock_guard<std::mutex> cleanup_lock(cleanup_mutex_);

  CleanupReport                            report;
  std::vector<db::model::CacheEntryRecord> victims;

  {
    auto tx      = repository_->Begin();
    auto entries = repository_->ListCacheEntries(*tx);

    auto age = [now_ms](const db::model::CacheEntryRecord& entry) { return now_ms > entry.created_at_ms ? now_ms - entry.created_at_ms : 0; };

    std::vector<db::model::CacheEntryRecord> kept;
    uint64_t                                 total = 0;
    for (auto& entry : entries) {
      if (age(entry) > policy_.max_age_ms) {
        ++report.expired;
        victims.push_back(std::move(entry));
      } else {
        total += entry.size_bytes;
        kept.push_back(std::move(entry));
      }
    }

    if (total > policy_.max_total_bytes) {
      std::vector<db::model::CacheEntryRecord> survivors;
      for (auto& entry : kept) {
        if (age(entry) > policy_.pressure_max_age_ms) {
          ++report.pressure_evicted;
          total -= entry.size_bytes;
          victims.push_back(std::move(entry));
        } else {
          survivors.push_back(std::move(entry));
        }
      }
      kept = std::move(survivors);
    }

    // kept is still oldest first
    size_t next = 0;
    while (total > policy_.max_total_bytes && next < kept.size()) {
      ++report.size_evicted;
      total -= kept[next].size_bytes;
      victims.push_back(std::move(kept[next]));
      ++next;
    }

    for (const auto& victim : victims) {
      ThrowIfDbError(repository_->DeleteCacheEntry(*tx, victim.key), "evict cache entry");
      report.bytes_freed += victim.size_bytes;
    }
    tx->Commit();

    report.remaining_entries = kept.size() - next;
    report.remaining_bytes   = total;
  }

  // rows are gone; stray blobs are harmless
  for (const auto& victim : victims) {
    try {
      blobs_->Remove(victim.blob_key);
    } catch (const std::exception& e) {
      CHUNKSCRIBE_LOG_WARN("Failed to remove evicted cache blob", {StringField("blob_key", victim.blob_key), StringField("error", e.what())});
    }
  }

  if (report.Removed() > 0) {
    CHUNKSCRIBE_LOG_INFO("Cache cleanup", {IntField("expired", static_cast<int64_t>(report.expired)),
                                           IntField("pressure_evicted", static_cast<int64_t>(report.pressure_evicted)),
                                           IntField("size_evicted", static_cast<int64_t>(report.size_evicted)),
                                           IntField("bytes_freed", static_cast<int64_t>(report.bytes_freed)),
                                           IntField("remaining_bytes", static_cast<int64_t>(report.remaining_bytes))});
  }
  return report;
}

void ArtifactCache::NoteWorkCompleted() {
  try {
    Cleanup(util::NowMillis());
  } catch (const std::exception& e) {
    CHUNKSCRIBE_LOG_WARN("Opportunistic cache cleanup failed", {StringField("error", e.what())});
  }
}

CacheStats ArtifactCache::Stats() {
  CacheStats stats;
  auto       tx = repository_->Begin();
  for (const auto& entry : repository_->ListCacheEntries(*tx)) {
    ++stats.entries;
    stats.total_bytes += entry.size_bytes;
    stats.total_hits += entry.hit_count;
  }
  tx->Commit();
  return stats;
}

} // namespace chunkscribe::cache
