#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_blob_store.hpp"
#include "ram/ram_blob_store.hpp"

namespace chunkscribe::storage {

StorageBackendPtr StorageFactory::Build(const chunkscribe::runtime::config::StorageConfig& cfg) {
  if (cfg.has_ram()) {
    return std::make_shared<RamBlobStore>();
  }

  std::filesystem::path disk_root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/chunkscribe"} : std::filesystem::path{cfg.disk().root_path()};
  return std::make_shared<DiskBlobStore>(std::move(disk_root), cfg.disk().fsync());
}

} // namespace chunkscribe::storage
