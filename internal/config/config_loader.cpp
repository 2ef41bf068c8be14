#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "defaults.hpp"

namespace chunkscribe::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0.0.0.0:50061", "8080")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static chunkscribe::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  chunkscribe::runtime::config::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

chunkscribe::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

chunkscribe::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(chunkscribe::runtime::config::RuntimeConfig& config) {
  using namespace chunkscribe::config::defaults;

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(std::string(kBindAddress));

  if (config.storage().backend_case() == chunkscribe::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    config.mutable_storage()->mutable_disk()->set_root_path(std::string(kDiskRootPath));
  } else if (config.storage().has_disk() && config.storage().disk().root_path().empty()) {
    config.mutable_storage()->mutable_disk()->set_root_path(std::string(kDiskRootPath));
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->max_blob_bytes() == 0) ingest->set_max_blob_bytes(kMaxBlobBytes);
  if (ingest->allowed_extensions().empty()) {
    for (auto ext : kAllowedExtensions) ingest->add_allowed_extensions(std::string(ext));
  }
  if (ingest->default_overlap_seconds() == 0.0) ingest->set_default_overlap_seconds(kDefaultOverlapSeconds);
  if (ingest->default_overlap_seconds() < 0.0) {
    throw std::runtime_error("Invalid configuration: ingest.default_overlap_seconds must be >= 0");
  }

  auto* transcription = config.mutable_transcription();
  if (transcription->workers() == 0) transcription->set_workers(kWorkers);
  if (transcription->max_attempts() == 0) transcription->set_max_attempts(kMaxAttempts);
  if (transcription->initial_backoff_ms() == 0) transcription->set_initial_backoff_ms(kInitialBackoffMs);
  if (transcription->backoff_multiplier() == 0.0) transcription->set_backoff_multiplier(kBackoffMultiplier);
  if (transcription->max_backoff_ms() == 0) transcription->set_max_backoff_ms(kMaxBackoffMs);
  if (transcription->backoff_multiplier() < 1.0) {
    throw std::runtime_error("Invalid configuration: transcription.backoff_multiplier must be >= 1");
  }

  auto* aggregation = config.mutable_aggregation();
  if (aggregation->char_budget() == 0) aggregation->set_char_budget(kCharBudget);
  if (aggregation->words_per_second() <= 0.0) aggregation->set_words_per_second(kWordsPerSecond);
  if (aggregation->chars_per_word() <= 0.0) aggregation->set_chars_per_word(kCharsPerWord);

  auto* cache = config.mutable_cache();
  if (cache->max_age_seconds() == 0) cache->set_max_age_seconds(kCacheMaxAgeSeconds);
  if (cache->pressure_max_age_seconds() == 0) cache->set_pressure_max_age_seconds(kCachePressureMaxAgeSeconds);
  if (cache->max_total_bytes() == 0) cache->set_max_total_bytes(kCacheMaxTotalBytes);
  if (cache->cleanup_interval_seconds() == 0) cache->set_cleanup_interval_seconds(kCacheCleanupIntervalSeconds);
  if (cache->pressure_max_age_seconds() > cache->max_age_seconds()) {
    throw std::runtime_error("Invalid configuration: cache.pressure_max_age_seconds must not exceed cache.max_age_seconds");
  }

  auto* stt = config.mutable_stt();
  if (stt->base_url().empty()) stt->set_base_url(std::string(kSttBaseUrl));
  if (stt->api_key_env().empty()) stt->set_api_key_env(std::string(kSttApiKeyEnv));
  if (stt->model().empty()) stt->set_model(std::string(kSttModel));
  if (stt->timeout_ms() == 0) stt->set_timeout_ms(kSttTimeoutMs);

  auto* tts = config.mutable_tts();
  if (tts->base_url().empty()) tts->set_base_url(std::string(kTtsBaseUrl));
  if (tts->api_key_env().empty()) tts->set_api_key_env(std::string(kTtsApiKeyEnv));
  if (tts->model().empty()) tts->set_model(std::string(kTtsModel));
  if (tts->default_voice().empty()) tts->set_default_voice(std::string(kTtsDefaultVoice));
  if (tts->default_format().empty()) tts->set_default_format(std::string(kTtsDefaultFormat));
  if (tts->timeout_ms() == 0) tts->set_timeout_ms(kTtsTimeoutMs);

  auto* notifications = config.mutable_notifications();
  if (notifications->timeout_ms() == 0) notifications->set_timeout_ms(kWebhookTimeoutMs);

  auto* maintenance = config.mutable_maintenance();
  if (maintenance->interval_seconds() == 0) maintenance->set_interval_seconds(kMaintenanceIntervalSeconds);
  if (maintenance->retention_max_age_seconds() == 0) maintenance->set_retention_max_age_seconds(kRetentionMaxAgeSeconds);
}

} // namespace chunkscribe::config
