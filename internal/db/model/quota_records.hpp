#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace workflow::db::model {

// Append-only usage snapshot; usage_data is the JSON status document.
struct QuotaUsageRecord {
  std::string                log_id;
  std::optional<std::string> workflow_id;
  std::string                service_name;
  std::string                usage_data = "{}";

  uint64_t created_at_ms = 0;
  uint64_t sequence      = 0;
};

// Unique on (service_name, quota_type).
struct QuotaLimitRecord {
  std::string limit_id;
  std::string service_name;
  std::string quota_type;

  int64_t limit_value    = 0;
  int64_t window_seconds = 0;
  bool    is_active      = true;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace workflow::db::model
