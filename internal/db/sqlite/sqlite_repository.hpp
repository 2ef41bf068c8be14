#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace chunkscribe::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
