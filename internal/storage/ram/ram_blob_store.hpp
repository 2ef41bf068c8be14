#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>

#include <arrow/buffer.h>

#include "internal/storage/storage_backend.hpp"

namespace chunkscribe::storage {

/*
  RAM blob storage.

  Backed by Arrow buffers stored in-memory. Nothing survives a restart.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public StorageBackend {
public:
  RamBlobStore() = default;
  ~RamBlobStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  bool Exists(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void Remove(const std::string& key) override;

  std::string Name() const override { return "ram"; }

  size_t Count() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace chunkscribe::storage
