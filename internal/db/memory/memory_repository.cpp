#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace chunkscribe::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, "session exists: " + r.session_id);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.session_id < b.session_id; });
  return records;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessionsByStatus(Transaction& t, chunkscribe::core::v1::SessionStatus status) {
  auto records = ListSessions(t);
  records.erase(std::remove_if(records.begin(), records.end(), [status](const auto& r) { return r.status != status; }), records.end());
  return records;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::NotFound, "session not found: " + r.session_id);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  auto& s = TX(t).Mutable();
  s.sessions.erase(session_id);
  s.chunks.erase(session_id);
  s.transcripts.erase(session_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertChunk(Transaction& t, const model::ChunkRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "chunk references unknown session: " + r.session_id);
  }
  s.chunks[r.session_id][r.sequence_index] = r;
  return Result::Ok();
}

std::optional<model::ChunkRecord> MemoryRepository::GetChunk(Transaction& t, const std::string& session_id, uint32_t sequence_index) {
  const auto& s       = TX(t).View();
  auto        session = s.chunks.find(session_id);
  if (session == s.chunks.end()) return std::nullopt;
  auto it = session->second.find(sequence_index);
  if (it == session->second.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ChunkRecord> MemoryRepository::ListChunks(Transaction& t, const std::string& session_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::ChunkRecord> out;
  auto                            session = s.chunks.find(session_id);
  if (session == s.chunks.end()) return out;
  out.reserve(session->second.size());
  for (const auto& [_, chunk] : session->second) out.push_back(chunk);
  return out;
}

std::vector<model::ChunkRecord> MemoryRepository::ListChunksByTranscriptionStatus(Transaction& t, chunkscribe::core::v1::TranscriptionStatus status) {
  const auto&                     s = TX(t).View();
  std::vector<model::ChunkRecord> out;
  for (const auto& [_, by_index] : s.chunks) {
    for (const auto& [__, chunk] : by_index) {
      if (chunk.transcription_status == status) out.push_back(chunk);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.session_id == b.session_id ? a.sequence_index < b.sequence_index : a.session_id < b.session_id;
  });
  return out;
}

Result MemoryRepository::UpdateChunk(Transaction& t, const model::ChunkRecord& r) {
  auto& s       = TX(t).Mutable();
  auto  session = s.chunks.find(r.session_id);
  if (session == s.chunks.end() || !session->second.contains(r.sequence_index)) {
    return Result::Err(ErrorCode::NotFound, "chunk not found: " + r.session_id + "#" + std::to_string(r.sequence_index));
  }
  session->second[r.sequence_index] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Transcripts
// ------------------------------------------------------------------

Result MemoryRepository::InsertTranscript(Transaction& t, const model::TranscriptRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.transcripts.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, "transcript exists: " + r.session_id);
  s.transcripts[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::TranscriptRecord> MemoryRepository::GetTranscript(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.transcripts.find(session_id);
  if (it == s.transcripts.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Cache index
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  TX(t).Mutable().cache_entries[r.key] = r;
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.cache_entries.find(key);
  if (it == s.cache_entries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CacheEntryRecord> MemoryRepository::ListCacheEntries(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::CacheEntryRecord> out;
  out.reserve(s.cache_entries.size());
  for (const auto& [_, entry] : s.cache_entries) out.push_back(entry);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms == b.created_at_ms ? a.key < b.key : a.created_at_ms < b.created_at_ms;
  });
  return out;
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  TX(t).Mutable().cache_entries.erase(key);
  return Result::Ok();
}

} // namespace chunkscribe::db::memory
