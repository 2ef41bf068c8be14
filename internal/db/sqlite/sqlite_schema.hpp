#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace chunkscribe::db::sqlite {

inline constexpr int kSchemaVersion = 1;

// Creates tables and indexes if missing and records the schema version.
void BootstrapSchema(SqliteDB& db);

} // namespace chunkscribe::db::sqlite
