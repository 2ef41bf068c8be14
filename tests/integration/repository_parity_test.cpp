#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using namespace chunkscribe::core::v1;
using chunkscribe::db::ErrorCode;
using chunkscribe::db::Repository;
using chunkscribe::db::memory::MemoryRepository;
using chunkscribe::db::model::CacheEntryRecord;
using chunkscribe::db::model::ChunkRecord;
using chunkscribe::db::model::SessionRecord;
using chunkscribe::db::model::TranscriptRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SessionRecord Session(const std::string& id, SessionStatus status = SESSION_STATUS_OPEN) {
  SessionRecord session;
  session.session_id    = id;
  session.status        = status;
  session.created_at_ms = NowMs();
  session.updated_at_ms = session.created_at_ms;
  return session;
}

ChunkRecord Chunk(const std::string& session_id, uint32_t index) {
  ChunkRecord chunk;
  chunk.session_id      = session_id;
  chunk.sequence_index  = index;
  chunk.chunk_id        = session_id + "-" + std::to_string(index);
  chunk.blob_key        = "sessions/" + session_id + "/chunk_" + std::to_string(index);
  chunk.file_extension  = "webm";
  chunk.size_bytes      = 100 + index;
  chunk.overlap_seconds = 2.0;
  chunk.created_at_ms   = NowMs();
  chunk.updated_at_ms   = chunk.created_at_ms;
  return chunk;
}

CacheEntryRecord Entry(const std::string& key, uint64_t created_at_ms) {
  CacheEntryRecord entry;
  entry.key           = key;
  entry.kind          = "tts";
  entry.blob_key      = "cache/tts/" + key;
  entry.content_type  = "audio/mpeg";
  entry.size_bytes    = 42;
  entry.created_at_ms = created_at_ms;
  return entry;
}

void VerifySessions(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-sessions";

  auto tx = repo.Begin();

  auto session = Session(id);
  assert(repo.InsertSession(*tx, session));
  assert(repo.InsertSession(*tx, session).code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetSession(*tx, id);
  assert(loaded.has_value());
  assert(loaded->status == SESSION_STATUS_OPEN);
  assert(!loaded->total_chunks_expected.has_value());

  loaded->status                 = SESSION_STATUS_FAILED;
  loaded->total_chunks_expected  = 4;
  loaded->total_duration_seconds = 12.5;
  loaded->completed_at_ms        = 0;
  loaded->failure_reason         = "no chunks were uploaded";
  assert(repo.UpdateSession(*tx, *loaded));

  assert(repo.UpdateSession(*tx, Session(prefix + "-missing")).code == ErrorCode::NotFound);
  assert(!repo.GetSession(*tx, prefix + "-missing").has_value());
  tx->Commit();

  auto verify = repo.Begin();
  auto stored = repo.GetSession(*verify, id);
  assert(stored->status == SESSION_STATUS_FAILED);
  assert(stored->total_chunks_expected == 4u);
  assert(stored->total_duration_seconds == 12.5);
  assert(stored->failure_reason == "no chunks were uploaded");

  bool listed = false;
  for (const auto& s : repo.ListSessionsByStatus(*verify, SESSION_STATUS_FAILED)) {
    listed = listed || s.session_id == id;
  }
  assert(listed);
  for (const auto& s : repo.ListSessionsByStatus(*verify, SESSION_STATUS_OPEN)) {
    assert(s.session_id != id);
  }
  verify->Commit();
}

void VerifyChunks(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-chunks";

  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, Session(id, SESSION_STATUS_RECEIVING)));

  // inserted out of order
  assert(repo.UpsertChunk(*tx, Chunk(id, 2)));
  assert(repo.UpsertChunk(*tx, Chunk(id, 0)));

  auto done                 = Chunk(id, 1);
  done.transcription_status = TRANSCRIPTION_STATUS_COMPLETED;
  done.transcript_text      = "";
  done.confidence_score     = 0.8;
  done.duration_seconds     = 4.0;
  done.language             = "en";
  done.attempts             = 2;
  done.question_id          = "q-3";
  Segment segment;
  segment.set_start_seconds(0.5);
  segment.set_end_seconds(1.5);
  segment.set_text("um");
  segment.set_confidence(0.4);
  segment.set_sequence_index(1);
  done.segments.push_back(segment);
  assert(repo.UpsertChunk(*tx, done));
  tx->Commit();

  auto verify = repo.Begin();
  const auto chunks = repo.ListChunks(*verify, id);
  assert(chunks.size() == 3);
  assert(chunks[0].sequence_index == 0);
  assert(chunks[1].sequence_index == 1);
  assert(chunks[2].sequence_index == 2);

  // an empty transcript is still a transcript
  assert(chunks[1].transcript_text.has_value());
  assert(chunks[1].transcript_text->empty());
  assert(!chunks[0].transcript_text.has_value());
  assert(chunks[1].segments.size() == 1);
  assert(chunks[1].segments[0].text() == "um");
  assert(chunks[1].segments[0].end_seconds() == 1.5);
  assert(chunks[1].confidence_score == 0.8);
  assert(chunks[1].language == "en");
  assert(chunks[1].attempts == 2);
  assert(chunks[1].question_id == "q-3");
  assert(chunks[2].size_bytes == 102);
  verify->Commit();

  // replace by key
  auto replace_tx = repo.Begin();
  auto replaced   = Chunk(id, 2);
  replaced.chunk_id  = id + "-2-again";
  replaced.size_bytes = 7;
  assert(repo.UpsertChunk(*replace_tx, replaced));

  auto failed                 = *repo.GetChunk(*replace_tx, id, 0);
  failed.transcription_status = TRANSCRIPTION_STATUS_FAILED;
  failed.last_error           = "rejected: HTTP 400";
  assert(repo.UpdateChunk(*replace_tx, failed));
  assert(repo.UpdateChunk(*replace_tx, Chunk(id, 9)).code == ErrorCode::NotFound);
  replace_tx->Commit();

  auto check = repo.Begin();
  assert(repo.ListChunks(*check, id).size() == 3);
  assert(repo.GetChunk(*check, id, 2)->chunk_id == id + "-2-again");
  assert(repo.GetChunk(*check, id, 2)->size_bytes == 7);
  assert(repo.GetChunk(*check, id, 0)->last_error == "rejected: HTTP 400");
  assert(!repo.GetChunk(*check, id, 5).has_value());

  bool pending_found = false;
  for (const auto& chunk : repo.ListChunksByTranscriptionStatus(*check, TRANSCRIPTION_STATUS_PENDING)) {
    if (chunk.session_id == id) {
      assert(chunk.sequence_index == 2);
      pending_found = true;
    }
  }
  assert(pending_found);
  check->Commit();

  // chunks need a session
  auto orphan_tx = repo.Begin();
  assert(repo.UpsertChunk(*orphan_tx, Chunk(prefix + "-nobody", 0)).code == ErrorCode::ConstraintViolation);
  orphan_tx->Rollback();
}

void VerifyTranscriptsAndCascade(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-cascade";

  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, Session(id, SESSION_STATUS_COMPLETED)));
  assert(repo.UpsertChunk(*tx, Chunk(id, 0)));

  TranscriptRecord record;
  record.session_id = id;
  record.transcript.set_session_id(id);
  record.transcript.set_full_transcript("hello there, how are you");
  record.transcript.set_confidence_score(0.75);
  record.created_at_ms = NowMs();
  assert(repo.InsertTranscript(*tx, record));
  assert(repo.InsertTranscript(*tx, record).code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read = repo.Begin();
  auto stored = repo.GetTranscript(*read, id);
  assert(stored.has_value());
  assert(stored->transcript.full_transcript() == "hello there, how are you");
  assert(stored->transcript.confidence_score() == 0.75);
  read->Commit();

  auto del = repo.Begin();
  assert(repo.DeleteSession(*del, id));
  del->Commit();

  auto verify = repo.Begin();
  assert(!repo.GetSession(*verify, id).has_value());
  assert(repo.ListChunks(*verify, id).empty());
  assert(!repo.GetTranscript(*verify, id).has_value());
  verify->Commit();
}

void VerifyCacheEntries(Repository& repo, const std::string& prefix) {
  const auto older = prefix + "-cache-old";
  const auto newer = prefix + "-cache-new";

  auto tx = repo.Begin();
  assert(repo.UpsertCacheEntry(*tx, Entry(newer, 2'000)));
  assert(repo.UpsertCacheEntry(*tx, Entry(older, 1'000)));

  auto hit           = Entry(newer, 2'000);
  hit.hit_count      = 3;
  hit.last_hit_at_ms = 5'000;
  assert(repo.UpsertCacheEntry(*tx, hit));
  tx->Commit();

  auto verify  = repo.Begin();
  auto entries = repo.ListCacheEntries(*verify);
  std::vector<std::string> keys;
  for (const auto& entry : entries) {
    if (entry.key == older || entry.key == newer) keys.push_back(entry.key);
  }
  assert((keys == std::vector<std::string>{older, newer}));

  auto loaded = repo.GetCacheEntry(*verify, newer);
  assert(loaded->hit_count == 3);
  assert(loaded->last_hit_at_ms == 5'000);
  assert(loaded->blob_key == "cache/tts/" + newer);
  verify->Commit();

  auto del = repo.Begin();
  assert(repo.DeleteCacheEntry(*del, older));
  del->Commit();

  auto check = repo.Begin();
  assert(!repo.GetCacheEntry(*check, older).has_value());
  assert(repo.GetCacheEntry(*check, newer).has_value());
  check->Commit();
}

void VerifyRollback(Repository& repo, const std::string& prefix) {
  const auto explicit_id = prefix + "-rollback";
  const auto implicit_id = prefix + "-dropped";

  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, Session(explicit_id)));
    tx->Rollback();
    assert(tx->IsCommitted());
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, Session(implicit_id)));
  }

  auto verify = repo.Begin();
  assert(!repo.GetSession(*verify, explicit_id).has_value());
  assert(!repo.GetSession(*verify, implicit_id).has_value());
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto id   = prefix + "-durable";
  auto       repo = backend.make_repository();
  {
    auto tx      = repo->Begin();
    auto session = Session(id, SESSION_STATUS_RECEIVING);
    session.total_chunks_expected = 2;
    assert(repo->InsertSession(*tx, session));

    auto chunk                 = Chunk(id, 0);
    chunk.transcription_status = TRANSCRIPTION_STATUS_PROCESSING;
    assert(repo->UpsertChunk(*tx, chunk));
    assert(repo->UpsertCacheEntry(*tx, Entry(id + "-entry", 10)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetSession(*tx, id);
  assert(s.has_value());
  assert(s->status == SESSION_STATUS_RECEIVING);
  assert(s->total_chunks_expected == 2u);

  auto c = repo->GetChunk(*tx, id, 0);
  assert(c.has_value());
  assert(c->transcription_status == TRANSCRIPTION_STATUS_PROCESSING);
  assert(repo->GetCacheEntry(*tx, id + "-entry").has_value());
  tx->Commit();
}

void RunParitySuite(BackendFactory backend) {
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  auto repo = backend.make_repository();
  VerifySessions(*repo, prefix);
  VerifyChunks(*repo, prefix);
  VerifyTranscriptsAndCascade(*repo, prefix);
  VerifyCacheEntries(*repo, prefix);
  VerifyRollback(*repo, prefix);
  repo.reset();

  VerifyRestartDurability(backend, prefix);
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("chunkscribe_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<chunkscribe::db::sqlite::SqliteDB>(db_path);
    chunkscribe::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<chunkscribe::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

} // namespace

int main() {
  RunParitySuite(MakeMemoryFactory());
  RunParitySuite(MakeSqliteFactory());

  std::cout << "chunkscribe_integration_repository_parity: pass\n";
  return 0;
}
