#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/workflow_state.hpp"

namespace workflow::db {

/*
  Listing filter for workflow rows. Empty fields match everything.
  Results are ordered by created_at_ms, then id.
*/
struct WorkflowFilter {
  std::vector<workflow::model::WorkflowState> states;

  // next_retry_at_ms set and <= this value
  std::optional<uint64_t> retry_due_at_ms;

  // 0 = unlimited
  std::size_t limit = 0;
};

/*
  Claim selection: state queued, next_retry_at unset or <= now_ms,
  lease unset or acquired before lease_cutoff_ms.
  Ordered by priority desc, queued_at asc.
*/
struct ClaimCriteria {
  uint64_t now_ms          = 0;
  uint64_t lease_cutoff_ms = 0;
};

} // namespace workflow::db
