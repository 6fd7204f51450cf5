#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace workflow::model {

enum class WorkflowState : std::uint8_t {
  kCreated            = 0,
  kQueued             = 1,
  kProcessing         = 2,
  kCompleted          = 3,
  kFailed             = 4,
  kQuotaExceeded      = 5,
  kPartiallyProcessed = 6,
  kSuspended          = 7,
  kCancelled          = 8,
};

inline constexpr std::array<WorkflowState, 9> kAllStates = {
    WorkflowState::kCreated,       WorkflowState::kQueued,             WorkflowState::kProcessing,
    WorkflowState::kCompleted,     WorkflowState::kFailed,             WorkflowState::kQuotaExceeded,
    WorkflowState::kPartiallyProcessed, WorkflowState::kSuspended,     WorkflowState::kCancelled,
};

constexpr bool IsTerminal(WorkflowState state) {
  return state == WorkflowState::kCompleted || state == WorkflowState::kCancelled;
}

/*
  Allowed edges. Self-edges exist only for processing (stage advance)
  and quota_exceeded (status refresh).
*/
constexpr bool CanTransition(WorkflowState from, WorkflowState to) {
  using S = WorkflowState;
  switch (from) {
    case S::kCreated:
      return to == S::kQueued || to == S::kCancelled;
    case S::kQueued:
      return to == S::kProcessing || to == S::kSuspended || to == S::kCancelled;
    case S::kProcessing:
      return to == S::kProcessing || to == S::kCompleted || to == S::kFailed || to == S::kQuotaExceeded || to == S::kPartiallyProcessed ||
             to == S::kQueued || to == S::kSuspended;
    case S::kQuotaExceeded:
      return to == S::kQuotaExceeded || to == S::kQueued || to == S::kSuspended || to == S::kCancelled;
    case S::kPartiallyProcessed:
      return to == S::kProcessing || to == S::kQueued || to == S::kCancelled;
    case S::kFailed:
      return to == S::kQueued || to == S::kCancelled;
    case S::kSuspended:
      return to == S::kQueued || to == S::kCancelled;
    case S::kCompleted:
    case S::kCancelled:
      return false;
  }
  return false;
}

// Entering one of these stamps completed_at.
constexpr bool IsFinished(WorkflowState state) {
  return state == WorkflowState::kCompleted || state == WorkflowState::kFailed || state == WorkflowState::kCancelled;
}

std::string_view             ToString(WorkflowState state);
std::optional<WorkflowState> ParseState(std::string_view text);

// Throws std::invalid_argument for unknown names (store decoding).
WorkflowState StateFromString(std::string_view text);

} // namespace workflow::model
