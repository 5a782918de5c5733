#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace eventcache::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("12345" as an entity id)
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
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

eventcache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  eventcache::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(eventcache::runtime::config::RuntimeConfig* config) {
  using namespace eventcache::runtime::config;

  auto* api = config->mutable_api();
  if (api->api_key_env().empty()) api->set_api_key_env("EVENTCACHE_API_KEY");
  if (api->auth_header().empty()) api->set_auth_header("x-api-key");
  if (api->user_agent().empty()) api->set_user_agent("eventcache/1.0");
  if (api->per_page() == 0) api->set_per_page(500);
  if (api->request_timeout_ms() == 0) api->set_request_timeout_ms(30000);
  if (api->retry_attempts() == 0) api->set_retry_attempts(3);

  auto* cache = config->mutable_cache();
  if (cache->root_path().empty()) cache->set_root_path("data/cache");

  auto* writer = config->mutable_writer();
  if (writer->flush_rows() == 0) writer->set_flush_rows(10000);
  if (writer->compression() == COMPRESSION_UNSPECIFIED) writer->set_compression(COMPRESSION_SNAPPY);
  if (writer->timestamp_column().empty()) writer->set_timestamp_column("timestamp");

  auto* polling = config->mutable_polling();
  if (polling->initial_delay_ms() == 0) polling->set_initial_delay_ms(500);
  if (polling->max_delay_ms() == 0) polling->set_max_delay_ms(8000);
  if (polling->max_attempts() == 0) polling->set_max_attempts(120);
  if (polling->max_wall_seconds() == 0) polling->set_max_wall_seconds(600);
  if (polling->progress_log_every() == 0) polling->set_progress_log_every(10);

  auto* rate_limit = config->mutable_rate_limit();
  if (rate_limit->default_wait_seconds() == 0) rate_limit->set_default_wait_seconds(5);
  if (rate_limit->max_wait_seconds() == 0) rate_limit->set_max_wait_seconds(60);
  if (rate_limit->max_retries() == 0) rate_limit->set_max_retries(5);

  auto* ingest = config->mutable_ingest();
  if (!ingest->has_dedupe_events()) ingest->set_dedupe_events(true);
  if (!ingest->has_divergence_tolerance()) ingest->set_divergence_tolerance(0.01);

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const eventcache::runtime::config::RuntimeConfig& config) {
  if (config.api().endpoint().empty()) {
    throw std::invalid_argument("api.endpoint is required");
  }
  if (config.api().endpoint().rfind("http://", 0) != 0 && config.api().endpoint().rfind("https://", 0) != 0) {
    throw std::invalid_argument("api.endpoint must be an http(s) URL");
  }
  if (config.api().per_page() > 10000) {
    throw std::invalid_argument("api.per_page must be at most 10000");
  }
  if (config.writer().flush_rows() == 0) {
    throw std::invalid_argument("writer.flush_rows must be positive");
  }
  if (config.polling().initial_delay_ms() > config.polling().max_delay_ms()) {
    throw std::invalid_argument("polling.initial_delay_ms must not exceed polling.max_delay_ms");
  }
  if (config.rate_limit().max_wait_seconds() < 1) {
    throw std::invalid_argument("rate_limit.max_wait_seconds must be at least 1");
  }
  if (config.ingest().divergence_tolerance() < 0.0 || config.ingest().divergence_tolerance() > 1.0) {
    throw std::invalid_argument("ingest.divergence_tolerance must be within [0, 1]");
  }
  if (config.cache().root_path().empty()) {
    throw std::invalid_argument("cache.root_path is required");
  }
}

std::string ConfigLoader::ResolveApiKey(const eventcache::runtime::config::RuntimeConfig& config) {
  const char* value = std::getenv(config.api().api_key_env().c_str());
  if (!value || std::string(value).empty()) {
    throw std::invalid_argument("environment variable " + config.api().api_key_env() + " holding the API key is not set");
  }
  return value;
}

} // namespace eventcache::config
