#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/storage_backend.hpp"

namespace chunkscribe::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (tmp + rename)
    - optional fsync
    - keys map to paths below root; parent directories are created on write
*/

class DiskBlobStore final : public StorageBackend {
public:
  DiskBlobStore(std::filesystem::path root, bool fsync);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  bool Exists(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void Remove(const std::string& key) override;

  std::string Name() const override { return "disk"; }

  const std::filesystem::path& Root() const { return root_; }

private:
  std::filesystem::path root_;
  bool fsync_;
};

}
