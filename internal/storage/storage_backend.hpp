#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace chunkscribe::storage {

/*
  Blob storage abstraction.

  Every blob is represented as an Arrow Buffer and addressed by a
  relative key such as "sessions/<session_id>/chunk_0003_<chunk_id>.webm"
  or "cache/<kind>/<fingerprint>".

  Implementations:
    DISK     -> Arrow file IO, atomic replace writes
    RAM      -> in-memory Arrow buffers (tests, ephemeral deployments)
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read the entire blob into an Arrow buffer.
    Throws util::NotFound if the key has no blob.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Size
  // ------------------------------------------------------------------
  /*
    The default implementation falls back to Read() and inspects buffer size.
  */
  virtual uint64_t Size(const std::string& key) {
    return static_cast<uint64_t>(Read(key)->size());
  }

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist a buffer under key. When Write returns the blob is durable
    (for backends that have durability) and visible to Read().
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Remove a blob. Missing keys are not an error.
  */
  virtual void Remove(const std::string& key) = 0;

  virtual std::string Name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace chunkscribe::storage
