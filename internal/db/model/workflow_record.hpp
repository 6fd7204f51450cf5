#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/workflow_state.hpp"

namespace workflow::db::model {

/*
  Persistent workflow item row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - state and version change only through the transition engine;
    version increases by exactly one per applied transition.
  - Rows are never deleted.

  Timestamps are unix milliseconds. JSON columns hold objects ("{}"
  when empty) except partial_results, which is empty when unset.
*/

struct WorkflowRecord {
  std::string id;

  workflow::model::WorkflowState state = workflow::model::WorkflowState::kCreated;

  uint64_t    version = 1;
  std::string stage;
  int32_t     priority = 0;

  int32_t                 retry_count = 0;
  int32_t                 max_retries = 3;
  std::optional<uint64_t> next_retry_at_ms;

  std::string payload       = "{}";
  std::string stage_details = "{}";
  std::string partial_results;

  int32_t                 quota_exceeded_count = 0;
  std::optional<uint64_t> last_quota_check_ms;

  std::optional<std::string> lease_holder;
  std::optional<uint64_t>    lease_acquired_at_ms;

  std::optional<std::string> last_error;

  uint64_t                created_at_ms       = 0;
  uint64_t                state_entered_at_ms = 0;
  std::optional<uint64_t> queued_at_ms;
  std::optional<uint64_t> processing_started_at_ms;
  std::optional<uint64_t> completed_at_ms;
};

} // namespace workflow::db::model
