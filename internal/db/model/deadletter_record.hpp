#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace workflow::db::model {

/*
  Dead-letter entry. At most one per workflow; repeated failures bump
  failure_count and overwrite the error columns.

  original_data is a JSON snapshot of the item at the last failure.
*/
struct DeadLetterRecord {
  std::string deadletter_id;
  std::string workflow_id;

  std::string original_data = "{}";
  std::string error_message;
  std::string error_details = "{}";

  int32_t  failure_count      = 1;
  uint64_t last_failure_at_ms = 0;
  uint64_t created_at_ms      = 0;

  std::optional<uint64_t>    resolved_at_ms;
  std::optional<std::string> resolution_notes;
};

} // namespace workflow::db::model
