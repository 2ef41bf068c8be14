#include "ram_blob_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace chunkscribe::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + key);

  return it->second;
}

bool RamBlobStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(key);
}

uint64_t RamBlobStore::Size(const std::string& key) {
  return static_cast<uint64_t>(Read(key)->size());
}

void RamBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateBlobKey(key);
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

void RamBlobStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

size_t RamBlobStore::Count() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace chunkscribe::storage
