#pragma once

#include <cstdint>
#include <string>

#include "internal/model/workflow_state.hpp"

namespace workflow::db::model {

/*
  Immutable audit row, one per applied transition.

  sequence is assigned by the store on insert and orders records
  across the whole store.
*/
struct TransitionRecord {
  std::string transition_id;
  std::string workflow_id;

  workflow::model::WorkflowState from_state = workflow::model::WorkflowState::kCreated;
  workflow::model::WorkflowState to_state   = workflow::model::WorkflowState::kCreated;

  std::string stage;
  std::string reason;
  std::string metadata = "{}";
  std::string actor;

  uint64_t created_at_ms = 0;
  uint64_t sequence      = 0;
};

} // namespace workflow::db::model
