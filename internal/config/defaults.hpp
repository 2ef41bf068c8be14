#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace chunkscribe::config::defaults {

inline constexpr std::string_view kBindAddress = "0.0.0.0:50061";

// ingest
inline constexpr uint64_t kMaxBlobBytes          = 100ull * 1024 * 1024;
inline constexpr double   kDefaultOverlapSeconds = 2.0;
inline constexpr std::array<std::string_view, 5> kAllowedExtensions = {"webm", "mp3", "wav", "m4a", "ogg"};

// transcription
inline constexpr uint32_t kWorkers           = 4;
inline constexpr uint32_t kMaxAttempts       = 3;
inline constexpr uint64_t kInitialBackoffMs  = 500;
inline constexpr double   kBackoffMultiplier = 2.0;
inline constexpr uint64_t kMaxBackoffMs      = 10'000;

// aggregation
inline constexpr uint32_t kCharBudget     = 50;
inline constexpr double   kWordsPerSecond = 2.5;
inline constexpr double   kCharsPerWord   = 10.0;

// cache
inline constexpr uint64_t kCacheMaxAgeSeconds         = 24 * 3600;
inline constexpr uint64_t kCachePressureMaxAgeSeconds = 3600;
inline constexpr uint64_t kCacheMaxTotalBytes         = 512ull * 1024 * 1024;
inline constexpr uint64_t kCacheCleanupIntervalSeconds = 3600;

// providers
inline constexpr std::string_view kSttBaseUrl   = "https://api.groq.com/openai/v1";
inline constexpr std::string_view kSttApiKeyEnv = "CHUNKSCRIBE_STT_API_KEY";
inline constexpr std::string_view kSttModel     = "whisper-large-v3";
inline constexpr uint64_t         kSttTimeoutMs = 30'000;

inline constexpr std::string_view kTtsBaseUrl       = "https://api.openai.com/v1";
inline constexpr std::string_view kTtsApiKeyEnv     = "CHUNKSCRIBE_TTS_API_KEY";
inline constexpr std::string_view kTtsModel         = "tts-1";
inline constexpr std::string_view kTtsDefaultVoice  = "alloy";
inline constexpr std::string_view kTtsDefaultFormat = "mp3";
inline constexpr uint64_t         kTtsTimeoutMs     = 30'000;

// notifications
inline constexpr uint64_t kWebhookTimeoutMs = 5'000;

// maintenance
inline constexpr uint64_t kMaintenanceIntervalSeconds = 300;
inline constexpr uint64_t kRetentionMaxAgeSeconds     = 7 * 24 * 3600;

inline constexpr std::string_view kDiskRootPath = "/tmp/chunkscribe";

} // namespace chunkscribe::config::defaults
