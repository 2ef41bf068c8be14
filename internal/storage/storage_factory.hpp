#pragma once

#include "storage_backend.hpp"
#include "config/config.pb.h"

namespace chunkscribe::storage {

/*
  Builds the blob store selected by configuration.

      storage:
        disk:
          root_path: /var/lib/chunkscribe
*/

class StorageFactory {
public:
  static StorageBackendPtr Build(const chunkscribe::runtime::config::StorageConfig& cfg);
};

} // namespace chunkscribe::storage
