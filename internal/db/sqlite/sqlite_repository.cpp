#include "sqlite_repository.hpp"

#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include <stdexcept>

#include "chunkscribe/core/v1/types.pb.h"

namespace chunkscribe::db::sqlite {

using chunkscribe::db::ErrorCode;
using chunkscribe::db::Result;

namespace v1 = chunkscribe::core::v1;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// needs extended result codes, enabled by SqliteDB
static bool IsDuplicateKey(int rc) {
    return rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE;
}

static sqlite3_stmt* PrepareOrNull(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return nullptr;
    return st;
}

// ------------------------------------------------------------------
// JSON columns
// ------------------------------------------------------------------

static std::string ToJson(const google::protobuf::Message& message) {
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json);
    if (!status.ok()) throw std::runtime_error("serialize json column: " + std::string(status.message()));
    return json;
}

static void FromJson(const std::string& json, google::protobuf::Message* message) {
    if (json.empty()) return;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
    if (!status.ok()) throw std::runtime_error("corrupt json column: " + std::string(status.message()));
}

static std::string SegmentsToJson(const std::vector<v1::Segment>& segments) {
    v1::SegmentList list;
    for (const auto& segment : segments) *list.add_segments() = segment;
    return ToJson(list);
}

static std::vector<v1::Segment> SegmentsFromJson(const std::string& json) {
    v1::SegmentList list;
    FromJson(json, &list);
    return {list.segments().begin(), list.segments().end()};
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

static constexpr const char* kSessionColumns =
    "session_id,status,total_chunks_expected,total_duration_seconds,created_at_ms,updated_at_ms,completed_at_ms,failure_reason";

static void BindSession(sqlite3_stmt* st, const model::SessionRecord& r) {
    BindText(st, 1, r.session_id);
    BindI32(st, 2, static_cast<int>(r.status));
    if (r.total_chunks_expected) {
        BindU64(st, 3, *r.total_chunks_expected);
    } else {
        sqlite3_bind_null(st, 3);
    }
    BindDouble(st, 4, r.total_duration_seconds);
    BindU64(st, 5, r.created_at_ms);
    BindU64(st, 6, r.updated_at_ms);
    BindU64(st, 7, r.completed_at_ms);
    BindText(st, 8, r.failure_reason);
}

static model::SessionRecord ReadSession(sqlite3_stmt* st) {
    model::SessionRecord r;
    r.session_id = ColText(st, 0);
    r.status = static_cast<v1::SessionStatus>(ColI32(st, 1));
    if (!ColIsNull(st, 2)) r.total_chunks_expected = static_cast<uint32_t>(ColU64(st, 2));
    r.total_duration_seconds = ColDouble(st, 3);
    r.created_at_ms = ColU64(st, 4);
    r.updated_at_ms = ColU64(st, 5);
    r.completed_at_ms = ColU64(st, 6);
    r.failure_reason = ColText(st, 7);
    return r;
}

static constexpr const char* kChunkColumns =
    "session_id,sequence_index,chunk_id,blob_key,file_extension,size_bytes,overlap_seconds,question_id,upload_status,"
    "transcription_status,transcript_text,segments_json,confidence_score,duration_seconds,language,attempts,last_error,"
    "created_at_ms,updated_at_ms";

static void BindChunk(sqlite3_stmt* st, const model::ChunkRecord& r) {
    BindText(st, 1, r.session_id);
    BindU64(st, 2, r.sequence_index);
    BindText(st, 3, r.chunk_id);
    BindText(st, 4, r.blob_key);
    BindText(st, 5, r.file_extension);
    BindU64(st, 6, r.size_bytes);
    BindDouble(st, 7, r.overlap_seconds);
    BindText(st, 8, r.question_id);
    BindI32(st, 9, static_cast<int>(r.upload_status));
    BindI32(st, 10, static_cast<int>(r.transcription_status));
    if (r.transcript_text) {
        BindText(st, 11, *r.transcript_text);
    } else {
        sqlite3_bind_null(st, 11);
    }
    BindText(st, 12, SegmentsToJson(r.segments));
    BindDouble(st, 13, r.confidence_score);
    BindDouble(st, 14, r.duration_seconds);
    BindText(st, 15, r.language);
    BindU64(st, 16, r.attempts);
    BindText(st, 17, r.last_error);
    BindU64(st, 18, r.created_at_ms);
    BindU64(st, 19, r.updated_at_ms);
}

static model::ChunkRecord ReadChunk(sqlite3_stmt* st) {
    model::ChunkRecord r;
    r.session_id = ColText(st, 0);
    r.sequence_index = static_cast<uint32_t>(ColU64(st, 1));
    r.chunk_id = ColText(st, 2);
    r.blob_key = ColText(st, 3);
    r.file_extension = ColText(st, 4);
    r.size_bytes = ColU64(st, 5);
    r.overlap_seconds = ColDouble(st, 6);
    r.question_id = ColText(st, 7);
    r.upload_status = static_cast<v1::UploadStatus>(ColI32(st, 8));
    r.transcription_status = static_cast<v1::TranscriptionStatus>(ColI32(st, 9));
    if (!ColIsNull(st, 10)) r.transcript_text = ColText(st, 10);
    r.segments = SegmentsFromJson(ColText(st, 11));
    r.confidence_score = ColDouble(st, 12);
    r.duration_seconds = ColDouble(st, 13);
    r.language = ColText(st, 14);
    r.attempts = static_cast<uint32_t>(ColU64(st, 15));
    r.last_error = ColText(st, 16);
    r.created_at_ms = ColU64(st, 17);
    r.updated_at_ms = ColU64(st, 18);
    return r;
}

static constexpr const char* kCacheColumns =
    "key,kind,blob_key,content_type,size_bytes,duration_seconds,created_at_ms,last_hit_at_ms,hit_count";

static void BindCacheEntry(sqlite3_stmt* st, const model::CacheEntryRecord& r) {
    BindText(st, 1, r.key);
    BindText(st, 2, r.kind);
    BindText(st, 3, r.blob_key);
    BindText(st, 4, r.content_type);
    BindU64(st, 5, r.size_bytes);
    BindDouble(st, 6, r.duration_seconds);
    BindU64(st, 7, r.created_at_ms);
    BindU64(st, 8, r.last_hit_at_ms);
    BindU64(st, 9, r.hit_count);
}

static model::CacheEntryRecord ReadCacheEntry(sqlite3_stmt* st) {
    model::CacheEntryRecord r;
    r.key = ColText(st, 0);
    r.kind = ColText(st, 1);
    r.blob_key = ColText(st, 2);
    r.content_type = ColText(st, 3);
    r.size_bytes = ColU64(st, 4);
    r.duration_seconds = ColDouble(st, 5);
    r.created_at_ms = ColU64(st, 6);
    r.last_hit_at_ms = ColU64(st, 7);
    r.hit_count = ColU64(st, 8);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO sessions(") + kSessionColumns + ") VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindSession(st, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (IsDuplicateKey(rc))
        return Result::Err(ErrorCode::AlreadyExists, "session exists: " + r.session_id);
    return Translate(db, rc);
}

std::optional<model::SessionRecord>
SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE session_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadSession(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::SessionRecord> out;

    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions ORDER BY session_id;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadSession(st));

    sqlite3_finalize(st);
    return out;
}

std::vector<model::SessionRecord>
SqliteRepository::ListSessionsByStatus(Transaction& t, v1::SessionStatus status) {
    auto* db = TX(t).Handle();
    std::vector<model::SessionRecord> out;

    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE status=? ORDER BY session_id;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    BindI32(st, 1, static_cast<int>(status));
    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadSession(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE sessions SET status=?,total_chunks_expected=?,total_duration_seconds=?,updated_at_ms=?,"
        "completed_at_ms=?,failure_reason=? WHERE session_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    if (r.total_chunks_expected) {
        BindU64(st, 2, *r.total_chunks_expected);
    } else {
        sqlite3_bind_null(st, 2);
    }
    BindDouble(st, 3, r.total_duration_seconds);
    BindU64(st, 4, r.updated_at_ms);
    BindU64(st, 5, r.completed_at_ms);
    BindText(st, 6, r.failure_reason);
    BindText(st, 7, r.session_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "session not found: " + r.session_id);
    return result;
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    for (const char* sql : {"DELETE FROM chunks WHERE session_id=?;",
                            "DELETE FROM session_transcripts WHERE session_id=?;",
                            "DELETE FROM sessions WHERE session_id=?;"}) {
        sqlite3_stmt* st = PrepareOrNull(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st, 1, session_id);
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);

        auto result = Translate(db, rc);
        if (!result) return result;
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertChunk(Transaction& t, const model::ChunkRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("INSERT INTO chunks(") + kChunkColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(session_id,sequence_index) DO UPDATE SET chunk_id=excluded.chunk_id, blob_key=excluded.blob_key, "
        "file_extension=excluded.file_extension, size_bytes=excluded.size_bytes, overlap_seconds=excluded.overlap_seconds, "
        "question_id=excluded.question_id, upload_status=excluded.upload_status, "
        "transcription_status=excluded.transcription_status, transcript_text=excluded.transcript_text, "
        "segments_json=excluded.segments_json, confidence_score=excluded.confidence_score, "
        "duration_seconds=excluded.duration_seconds, language=excluded.language, attempts=excluded.attempts, "
        "last_error=excluded.last_error, created_at_ms=excluded.created_at_ms, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindChunk(st, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::ChunkRecord>
SqliteRepository::GetChunk(Transaction& t, const std::string& session_id, uint32_t sequence_index) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE session_id=? AND sequence_index=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);
    BindU64(st, 2, sequence_index);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadChunk(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::ChunkRecord> SqliteRepository::ListChunks(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();
    std::vector<model::ChunkRecord> out;

    const std::string sql =
        std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE session_id=? ORDER BY sequence_index ASC;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    BindText(st, 1, session_id);
    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadChunk(st));

    sqlite3_finalize(st);
    return out;
}

std::vector<model::ChunkRecord>
SqliteRepository::ListChunksByTranscriptionStatus(Transaction& t, v1::TranscriptionStatus status) {
    auto* db = TX(t).Handle();
    std::vector<model::ChunkRecord> out;

    const std::string sql = std::string("SELECT ") + kChunkColumns +
                            " FROM chunks WHERE transcription_status=? ORDER BY session_id, sequence_index;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    BindI32(st, 1, static_cast<int>(status));
    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadChunk(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateChunk(Transaction& t, const model::ChunkRecord& r) {
    auto* db = TX(t).Handle();

    // same column order as kChunkColumns so BindChunk can be reused; key columns bind last
    const char* sql =
        "UPDATE chunks SET session_id=?1, sequence_index=?2, chunk_id=?3, blob_key=?4, file_extension=?5, size_bytes=?6, "
        "overlap_seconds=?7, question_id=?8, upload_status=?9, transcription_status=?10, transcript_text=?11, "
        "segments_json=?12, confidence_score=?13, duration_seconds=?14, language=?15, attempts=?16, last_error=?17, "
        "created_at_ms=?18, updated_at_ms=?19 WHERE session_id=?1 AND sequence_index=?2;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindChunk(st, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "chunk not found: " + r.session_id + "#" + std::to_string(r.sequence_index));
    return result;
}

// ------------------------------------------------------------------
// Transcripts
// ------------------------------------------------------------------

Result SqliteRepository::InsertTranscript(Transaction& t, const model::TranscriptRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT INTO session_transcripts(session_id,transcript_json,created_at_ms) VALUES(?,?,?);";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindText(st, 2, ToJson(r.transcript));
    BindU64(st, 3, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (IsDuplicateKey(rc))
        return Result::Err(ErrorCode::AlreadyExists, "transcript exists: " + r.session_id);
    return Translate(db, rc);
}

std::optional<model::TranscriptRecord>
SqliteRepository::GetTranscript(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT session_id,transcript_json,created_at_ms FROM session_transcripts WHERE session_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::TranscriptRecord r;
    r.session_id = ColText(st, 0);
    const auto json = ColText(st, 1);
    r.created_at_ms = ColU64(st, 2);
    sqlite3_finalize(st);

    FromJson(json, &r.transcript);
    return r;
}

// ------------------------------------------------------------------
// Cache index
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("INSERT INTO cache_entries(") + kCacheColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(key) DO UPDATE SET kind=excluded.kind, blob_key=excluded.blob_key, content_type=excluded.content_type, "
        "size_bytes=excluded.size_bytes, duration_seconds=excluded.duration_seconds, created_at_ms=excluded.created_at_ms, "
        "last_hit_at_ms=excluded.last_hit_at_ms, hit_count=excluded.hit_count;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindCacheEntry(st, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::CacheEntryRecord>
SqliteRepository::GetCacheEntry(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kCacheColumns + " FROM cache_entries WHERE key=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st, 1, key);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadCacheEntry(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::CacheEntryRecord> SqliteRepository::ListCacheEntries(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::CacheEntryRecord> out;

    const std::string sql = std::string("SELECT ") + kCacheColumns + " FROM cache_entries ORDER BY created_at_ms ASC, key ASC;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadCacheEntry(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM cache_entries WHERE key=?;";
    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, key);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace chunkscribe::db::sqlite
