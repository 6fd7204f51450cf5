#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>

namespace workflow::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // "!" is the tag yaml-cpp gives quoted scalars
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static workflow::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  workflow::runtime::config::RuntimeConfig config;
  // An empty document is a valid, all-defaults configuration.
  if (yaml.IsNull() || !yaml.IsDefined()) {
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

  return config;
}

static bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

static workflow::runtime::config::RuntimeConfig Finish(workflow::runtime::config::RuntimeConfig config) {
  ConfigLoader::ApplyEnvironment(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

workflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Finish(FromYamlNode(yaml));
}

workflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Finish(FromYamlNode(yaml));
}

void ConfigLoader::ApplyDatabaseUrl(workflow::runtime::config::RuntimeConfig& config, const std::string& url) {
  auto* database = config.mutable_database();

  if (StartsWith(url, "postgres://") || StartsWith(url, "postgresql://")) {
    // Keep a configured pool size across the switch.
    const auto max_connections = database->has_postgres() ? database->postgres().max_connections() : 0;
    database->mutable_postgres()->set_connection_uri(url);
    database->mutable_postgres()->set_max_connections(max_connections);
    return;
  }

  if (StartsWith(url, "sqlite://")) {
    const auto busy_timeout_ms = database->has_sqlite() ? database->sqlite().busy_timeout_ms() : 0;
    database->mutable_sqlite()->set_path(url.substr(std::string("sqlite://").size()));
    database->mutable_sqlite()->set_busy_timeout_ms(busy_timeout_ms);
    return;
  }

  if (url == "memory://") {
    database->clear_backend();
    return;
  }

  throw std::runtime_error("Invalid database URL: expected postgres://, postgresql://, sqlite:// or memory://");
}

void ConfigLoader::ApplyEnvironment(workflow::runtime::config::RuntimeConfig& config) {
  if (const char* url = std::getenv("WORKFLOW_DATABASE_URL"); url && *url) {
    ApplyDatabaseUrl(config, url);
  }

  if (const char* pool_size = std::getenv("WORKFLOW_DB_POOL_SIZE"); pool_size && *pool_size) {
    char*      end   = nullptr;
    const long value = std::strtol(pool_size, &end, 10);
    if (*end != '\0' || value <= 0) {
      throw std::runtime_error("Invalid WORKFLOW_DB_POOL_SIZE: " + std::string(pool_size));
    }
    if (config.database().has_postgres()) {
      config.mutable_database()->mutable_postgres()->set_max_connections(static_cast<uint32_t>(value));
    }
  }
}

void ConfigLoader::Validate(const workflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& limit : config.quota().default_limits()) {
    if (limit.service_name().empty() || limit.quota_type().empty()) {
      throw std::runtime_error("Invalid configuration: quota.default_limits entries need service_name and quota_type");
    }
    if (limit.limit_value() <= 0 || limit.window_seconds() <= 0) {
      throw std::runtime_error("Invalid configuration: quota limit " + limit.service_name() + "/" + limit.quota_type() +
                               " needs positive limit_value and window_seconds");
    }
    if (!seen.emplace(limit.service_name(), limit.quota_type()).second) {
      throw std::runtime_error("Invalid configuration: duplicate quota limit " + limit.service_name() + "/" + limit.quota_type());
    }
  }
}

} // namespace workflow::config
