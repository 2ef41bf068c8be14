#pragma once

#include <cstdint>
#include <string>

namespace chunkscribe::db::model {

/*
  Content-addressed cache row.

  key is the hex fingerprint of the inputs; blob_key points into the
  blob store and never changes for the life of the row.
*/
struct CacheEntryRecord {
  std::string key;
  std::string kind;
  std::string blob_key;
  std::string content_type;

  uint64_t size_bytes       = 0;
  double   duration_seconds = 0.0;

  uint64_t created_at_ms  = 0;
  uint64_t last_hit_at_ms = 0;
  uint64_t hit_count      = 0;
};

} // namespace chunkscribe::db::model
