#include "artifact_service.hpp"

#include "internal/cache/artifact_cache.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/tts/synthesis_service.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace chunkscribe::service {

using namespace chunkscribe::core::v1;
using namespace chunkscribe::services::v1;

CacheEntryDescriptor ToDescriptor(const db::model::CacheEntryRecord& entry) {
  CacheEntryDescriptor out;
  out.set_key(entry.key);
  out.set_kind(entry.kind);
  out.set_content_type(entry.content_type);
  out.set_size_bytes(entry.size_bytes);
  out.set_duration_seconds(entry.duration_seconds);
  out.set_created_at_ms(entry.created_at_ms);
  out.set_last_hit_at_ms(entry.last_hit_at_ms);
  out.set_hit_count(entry.hit_count);
  return out;
}

ArtifactService::ArtifactService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SynthesizeSpeechResponse ArtifactService::SynthesizeSpeech(const SynthesizeSpeechRequest& req) {
  return ObserveRpc("ArtifactService.SynthesizeSpeech", "", [&] {
    auto outcome = ctx_.synthesis->Synthesize(req.text(), req.voice(), req.format());

    SynthesizeSpeechResponse resp;
    *resp.mutable_entry() = ToDescriptor(outcome.entry);
    resp.set_was_cached(outcome.was_cached);
    return resp;
  });
}

GetArtifactResponse ArtifactService::GetArtifact(const GetArtifactRequest& req) {
  return ObserveRpc("ArtifactService.GetArtifact", "", [&] {
    if (req.key().empty()) {
      throw util::ValidationError("artifact key must not be empty");
    }
    auto artifact = ctx_.cache->Read(req.key());

    GetArtifactResponse resp;
    *resp.mutable_entry() = ToDescriptor(artifact.entry);
    resp.set_data(std::string(storage::common::AsStringView(*artifact.data)));
    return resp;
  });
}

GetCacheStatsResponse ArtifactService::GetCacheStats(const GetCacheStatsRequest&) {
  return ObserveRpc("ArtifactService.GetCacheStats", "", [&] {
    const auto stats = ctx_.cache->Stats();

    GetCacheStatsResponse resp;
    resp.set_entries(stats.entries);
    resp.set_total_bytes(stats.total_bytes);
    resp.set_total_hits(stats.total_hits);
    return resp;
  });
}

} // namespace chunkscribe::service
