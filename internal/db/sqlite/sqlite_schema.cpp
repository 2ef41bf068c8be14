#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace chunkscribe::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS sessions (session_id TEXT PRIMARY KEY, status INTEGER NOT NULL, total_chunks_expected INTEGER, "
      "total_duration_seconds REAL NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "completed_at_ms INTEGER NOT NULL DEFAULT 0, failure_reason TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS sessions_status_idx ON sessions(status);",
      "CREATE TABLE IF NOT EXISTS chunks (session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "sequence_index INTEGER NOT NULL, chunk_id TEXT NOT NULL, blob_key TEXT NOT NULL, file_extension TEXT NOT NULL, "
      "size_bytes INTEGER NOT NULL, overlap_seconds REAL NOT NULL, question_id TEXT NOT NULL DEFAULT '', upload_status INTEGER NOT NULL, "
      "transcription_status INTEGER NOT NULL, transcript_text TEXT, segments_json TEXT NOT NULL DEFAULT '{}', "
      "confidence_score REAL NOT NULL DEFAULT 0, duration_seconds REAL NOT NULL DEFAULT 0, language TEXT NOT NULL DEFAULT '', "
      "attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (session_id, sequence_index));",
      "CREATE INDEX IF NOT EXISTS chunks_transcription_status_idx ON chunks(transcription_status);",
      "CREATE TABLE IF NOT EXISTS session_transcripts (session_id TEXT PRIMARY KEY REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "transcript_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS cache_entries (key TEXT PRIMARY KEY, kind TEXT NOT NULL, blob_key TEXT NOT NULL, "
      "content_type TEXT NOT NULL, size_bytes INTEGER NOT NULL, duration_seconds REAL NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, last_hit_at_ms INTEGER NOT NULL DEFAULT 0, hit_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS cache_entries_created_idx ON cache_entries(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
}

} // namespace chunkscribe::db::sqlite
