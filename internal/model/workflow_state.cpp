#include "workflow_state.hpp"

#include <stdexcept>

namespace workflow::model {

std::string_view ToString(WorkflowState state) {
  switch (state) {
    case WorkflowState::kCreated:
      return "created";
    case WorkflowState::kQueued:
      return "queued";
    case WorkflowState::kProcessing:
      return "processing";
    case WorkflowState::kCompleted:
      return "completed";
    case WorkflowState::kFailed:
      return "failed";
    case WorkflowState::kQuotaExceeded:
      return "quota_exceeded";
    case WorkflowState::kPartiallyProcessed:
      return "partially_processed";
    case WorkflowState::kSuspended:
      return "suspended";
    case WorkflowState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<WorkflowState> ParseState(std::string_view text) {
  for (auto state : kAllStates) {
    if (ToString(state) == text) return state;
  }
  return std::nullopt;
}

WorkflowState StateFromString(std::string_view text) {
  auto state = ParseState(text);
  if (!state) throw std::invalid_argument("unknown workflow state: " + std::string(text));
  return *state;
}

} // namespace workflow::model
