#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/model/structured_payload.hpp"
#include "internal/model/workflow_state.hpp"
#include "internal/util/time.hpp"

namespace workflow::core {

struct TransitionRequest {
  std::string          workflow_id;
  model::WorkflowState from = model::WorkflowState::kCreated;
  model::WorkflowState to   = model::WorkflowState::kCreated;

  std::optional<std::string> stage;
  std::optional<std::string> reason;
  model::Attributes          metadata;
  std::string                actor = "system";
};

/*
  TransitionEngine

  Compare-and-swap state change. One applied transition is, atomically:
    - state := to, version += 1
    - stage / stage_details / lifecycle timestamps updated
      (completed_at cleared when a finished item is re-queued)
    - one transition record + one state_changed event
    - a state_duration sample for the state being left

  Illegal edges throw util::InvalidState before the store is touched.
  Unknown ids throw util::NotFound. A state other than `from` is the
  expected losing side of a race and reports false / nullopt.
*/
class TransitionEngine {
 public:
  // Extra row changes applied under the same lock. Must not touch
  // state or version.
  using RecordMutator = std::function<void(db::model::WorkflowRecord&)>;

  TransitionEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventEmitter> emitter,
                   std::shared_ptr<const util::Clock> clock);

  // Own transaction.
  bool Transition(const TransitionRequest& request);

  // Caller's transaction; returns the updated row.
  std::optional<db::model::WorkflowRecord> Apply(db::Transaction& tx, const TransitionRequest& request, const RecordMutator& mutator = {});

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<events::EventEmitter> emitter_;
  std::shared_ptr<const util::Clock>    clock_;
};

} // namespace workflow::core
