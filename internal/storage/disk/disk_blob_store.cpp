#include "disk_blob_store.hpp"

#include <arrow/io/file.h>
#include <filesystem>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace chunkscribe::storage {

using namespace chunkscribe::storage::common;

DiskBlobStore::DiskBlobStore(std::filesystem::path root, bool fsync)
    : root_(std::move(root)), fsync_(fsync) {

  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& key) {
  auto path = BlobPath(root_, key);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("blob not found: " + key);
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

bool DiskBlobStore::Exists(const std::string& key) {
  std::error_code ec;
  return std::filesystem::is_regular_file(BlobPath(root_, key), ec);
}

uint64_t DiskBlobStore::Size(const std::string& key) {
  std::error_code ec;
  auto size = std::filesystem::file_size(BlobPath(root_, key), ec);
  if (ec) throw util::NotFound("blob not found: " + key);
  return static_cast<uint64_t>(size);
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void DiskBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto final_path = BlobPath(root_, key);
  std::filesystem::create_directories(final_path.parent_path());

  // unique tmp name so concurrent writers of one key never share a tmp file
  auto tmp_path = final_path.string() + "." + util::NewId() + ".tmp";

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync_)
      Unwrap(out->Flush());

    Unwrap(out->Close());

    std::filesystem::rename(tmp_path, final_path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

void DiskBlobStore::Remove(const std::string& key) {
  auto path = BlobPath(root_, key);
  std::filesystem::remove(path);

  // drop the per-session directory once it is empty
  std::error_code ec;
  auto parent = path.parent_path();
  if (parent != root_ && std::filesystem::is_empty(parent, ec) && !ec) {
    std::filesystem::remove(parent, ec);
  }
}

}
