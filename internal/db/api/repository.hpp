#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/transcript_record.hpp"

namespace chunkscribe::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - (session_id, sequence_index) identifies exactly one chunk row
  - At most one transcript row per session

  The DB is the source of truth for:
    session state
    chunk metadata + transcription state
    cache index
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  virtual std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, chunkscribe::core::v1::SessionStatus status) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  // Removes the session together with its chunk rows and transcript.
  virtual Result DeleteSession(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  // Insert or replace the row for (session_id, sequence_index).
  virtual Result UpsertChunk(Transaction&, const model::ChunkRecord&) = 0;

  virtual std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string& session_id, uint32_t sequence_index) = 0;

  // Ordered by sequence_index ascending.
  virtual std::vector<model::ChunkRecord> ListChunks(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::ChunkRecord> ListChunksByTranscriptionStatus(Transaction&, chunkscribe::core::v1::TranscriptionStatus status) = 0;

  // NotFound if the row does not exist.
  virtual Result UpdateChunk(Transaction&, const model::ChunkRecord&) = 0;

  // ---------------------------------------------------------------------
  // Transcripts
  // ---------------------------------------------------------------------

  // AlreadyExists if the session already has one.
  virtual Result InsertTranscript(Transaction&, const model::TranscriptRecord&) = 0;

  virtual std::optional<model::TranscriptRecord> GetTranscript(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Cache index
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) = 0;

  // Ordered by created_at_ms ascending (oldest first).
  virtual std::vector<model::CacheEntryRecord> ListCacheEntries(Transaction&) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;
};

} // namespace chunkscribe::db
