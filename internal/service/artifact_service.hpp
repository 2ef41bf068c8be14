#pragma once

#include "chunkscribe/services/v1/artifact_service.pb.h"
#include "internal/db/model/cache_entry_record.hpp"
#include "service_context.hpp"

namespace chunkscribe::service {

class ArtifactService {
 public:
  explicit ArtifactService(ServiceContext ctx);

  chunkscribe::services::v1::SynthesizeSpeechResponse SynthesizeSpeech(const chunkscribe::services::v1::SynthesizeSpeechRequest& req);

  chunkscribe::services::v1::GetArtifactResponse GetArtifact(const chunkscribe::services::v1::GetArtifactRequest& req);

  chunkscribe::services::v1::GetCacheStatsResponse GetCacheStats(const chunkscribe::services::v1::GetCacheStatsRequest& req);

 private:
  ServiceContext ctx_;
};

chunkscribe::core::v1::CacheEntryDescriptor ToDescriptor(const db::model::CacheEntryRecord& entry);

} // namespace chunkscribe::service
