#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace chunkscribe::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&) override;
  std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, chunkscribe::core::v1::SessionStatus) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;
  Result DeleteSession(Transaction&, const std::string&) override;

  Result UpsertChunk(Transaction&, const model::ChunkRecord&) override;
  std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::ChunkRecord> ListChunks(Transaction&, const std::string&) override;
  std::vector<model::ChunkRecord> ListChunksByTranscriptionStatus(Transaction&, chunkscribe::core::v1::TranscriptionStatus) override;
  Result UpdateChunk(Transaction&, const model::ChunkRecord&) override;

  Result InsertTranscript(Transaction&, const model::TranscriptRecord&) override;
  std::optional<model::TranscriptRecord> GetTranscript(Transaction&, const std::string&) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string&) override;
  std::vector<model::CacheEntryRecord> ListCacheEntries(Transaction&) override;
  Result DeleteCacheEntry(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SessionRecord> sessions;
    // session_id -> sequence_index -> row; std::map keeps index order
    std::unordered_map<std::string, std::map<uint32_t, model::ChunkRecord>> chunks;
    std::unordered_map<std::string, model::TranscriptRecord> transcripts;
    std::unordered_map<std::string, model::CacheEntryRecord> cache_entries;
  };

  std::mutex mutex_;
  State committed_;
};

}
