#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace flowstead::config {

using flowstead::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
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
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml.IsDefined() || yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:7233");

  if (config.database().backend_case() == flowstead::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* engine = config.mutable_engine();
  if (engine->decision_threads() == 0) engine->set_decision_threads(4);
  if (!engine->has_run_lock_ttl()) *engine->mutable_run_lock_ttl() = util::ToProto(util::Millis{30000});
  if (!engine->has_sweep_interval()) *engine->mutable_sweep_interval() = util::ToProto(util::Millis{1000});
  if (!engine->has_default_start_to_close_timeout()) {
    *engine->mutable_default_start_to_close_timeout() = util::ToProto(util::Millis{60000});
  }
  if (!engine->has_engine_retry_initial()) *engine->mutable_engine_retry_initial() = util::ToProto(util::Millis{100});
  if (!engine->has_engine_retry_max()) *engine->mutable_engine_retry_max() = util::ToProto(util::Millis{10000});
  if (engine->list_page_size() == 0) engine->set_list_page_size(100);

  auto* workers = config.mutable_workers();
  if (workers->threads() == 0) workers->set_threads(2);
  if (!workers->has_poll_timeout()) *workers->mutable_poll_timeout() = util::ToProto(util::Millis{1000});

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& engine = config.engine();
  if (util::FromProto(engine.run_lock_ttl()).count() <= 0) {
    throw std::invalid_argument("engine.run_lock_ttl must be positive");
  }
  if (util::FromProto(engine.sweep_interval()).count() <= 0) {
    throw std::invalid_argument("engine.sweep_interval must be positive");
  }
  if (util::FromProto(engine.default_start_to_close_timeout()).count() <= 0) {
    throw std::invalid_argument("engine.default_start_to_close_timeout must be positive");
  }
  if (util::FromProto(engine.engine_retry_max()) < util::FromProto(engine.engine_retry_initial())) {
    throw std::invalid_argument("engine.engine_retry_max must not be below engine_retry_initial");
  }

  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri is required");
  }

  static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  bool known = false;
  for (const char* level : kLevels) {
    known = known || config.logging().level() == level;
  }
  if (!known) {
    throw std::invalid_argument("logging.level is not a known level: " + config.logging().level());
  }
}

} // namespace flowstead::config
