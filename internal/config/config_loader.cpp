#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace netorch::config {

namespace cfg = netorch::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars ("!" tag) are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
  }
}

static cfg::RuntimeConfig Parse(const YAML::Node& yaml) {
  cfg::RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

cfg::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(cfg::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(kDefaultPostgresConnections);
  }

  auto* lifecycle = config.mutable_workers()->mutable_lifecycle();
  if (lifecycle->poll_interval_ms() == 0) lifecycle->set_poll_interval_ms(kDefaultLifecyclePollMs);
  if (lifecycle->error_backoff_ms() == 0) lifecycle->set_error_backoff_ms(kDefaultWorkerErrorBackoffMs);

  auto* telemetry = config.mutable_workers()->mutable_telemetry();
  if (telemetry->collection_interval_ms() == 0) telemetry->set_collection_interval_ms(kDefaultTelemetryIntervalMs);
  if (telemetry->error_backoff_ms() == 0) telemetry->set_error_backoff_ms(kDefaultWorkerErrorBackoffMs);

  auto* analytics = config.mutable_analytics();
  if (analytics->default_window_minutes() == 0) analytics->set_default_window_minutes(kDefaultAnalysisWindowMinutes);
  if (analytics->default_window_minutes() > kMaxAnalysisWindowMinutes) {
    throw std::runtime_error("Invalid configuration: analytics.default_window_minutes must be at most " +
                             std::to_string(kMaxAnalysisWindowMinutes));
  }
  if (analytics->default_deviation_threshold() <= 0.0) analytics->set_default_deviation_threshold(kDefaultDeviationThreshold);
}

} // namespace netorch::config
