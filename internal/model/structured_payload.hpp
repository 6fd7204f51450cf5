#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/workflow_state.hpp"

namespace workflow::model {

/*
  Structured payloads carried by stage details, transition metadata,
  event data and error details.

  Known shapes are typed; anything else travels as a key-ordered
  Attributes map of scalars. Nested documents (producer payloads,
  partial results) stay JSON text and are never interpreted here.
*/

using Value      = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using Attributes = std::map<std::string, Value, std::less<>>;

struct StateChanged {
  std::string   transition_id;
  WorkflowState from_state = WorkflowState::kCreated;
  WorkflowState to_state   = WorkflowState::kCreated;
  std::string   stage;
  std::string   reason;
};

enum class LeaseChange : std::uint8_t {
  kAcquired,
  kReleased,
  kTakenOver,
};

struct LeaseChanged {
  LeaseChange change = LeaseChange::kAcquired;
  std::string worker_id;
  // Set for kTakenOver only.
  std::string previous_holder;
};

struct RetryScheduled {
  int           retry_count = 0;
  int           max_retries = 0;
  std::int64_t  delay_seconds = 0;
  std::uint64_t next_retry_at_ms = 0;
  std::string   error;
};

struct DeadLettered {
  std::string deadletter_id;
  int         failure_count = 0;
  bool        permanent     = false;
  std::string error;
};

struct QuotaExhausted {
  std::string              service_name;
  std::vector<std::string> quota_types;
  std::uint64_t            estimated_reset_ms = 0;
  std::int64_t             wait_seconds       = 0;
};

struct Enqueued {
  int priority    = 0;
  int max_retries = 0;
};

using StructuredPayload = std::variant<Attributes, StateChanged, LeaseChanged, RetryScheduled, DeadLettered, QuotaExhausted, Enqueued>;

// Event type name for a payload; Attributes map to "custom".
std::string_view EventTypeOf(const StructuredPayload& payload);

std::string_view ToString(LeaseChange change);

// Shallow merge: keys in overlay replace keys in base.
Attributes Merge(Attributes base, const Attributes& overlay);

} // namespace workflow::model
