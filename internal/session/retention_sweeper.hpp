#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"

namespace chunkscribe::session {

struct RetentionReport {
  uint64_t sessions_removed = 0;
  uint64_t chunks_removed   = 0;
};

/*
  Deletes COMPLETED and FAILED sessions whose last update is older than
  max_age, together with their chunk rows, transcript and audio blobs.
  Active sessions are never touched.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, uint64_t max_age_ms);

  RetentionReport Sweep(uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  storage::StorageBackendPtr      blobs_;
  uint64_t                        max_age_ms_;
};

} // namespace chunkscribe::session
