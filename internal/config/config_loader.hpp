#pragma once

#include <string>

#include "config/config.pb.h"

namespace workflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys
  are rejected. Quoted scalars always stay strings; bare scalars are
  typed as bool or number where they parse as one.

  Environment overrides are applied after parsing and before
  validation:
    WORKFLOW_DATABASE_URL   replaces the database section
    WORKFLOW_DB_POOL_SIZE   postgres max_connections
*/
class ConfigLoader {
 public:
  static workflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static workflow::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // postgres://... or postgresql://... selects postgres, sqlite://<path>
  // selects sqlite, memory:// selects the in-memory store.
  static void ApplyDatabaseUrl(workflow::runtime::config::RuntimeConfig& config, const std::string& url);
  static void ApplyEnvironment(workflow::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const workflow::runtime::config::RuntimeConfig& config);
};

} // namespace workflow::config
