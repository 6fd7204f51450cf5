#include "transition_engine.hpp"

#include "internal/model/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workflow::core {

using model::WorkflowState;

namespace {

double SecondsBetween(uint64_t earlier_ms, uint64_t later_ms) {
  return later_ms > earlier_ms ? static_cast<double>(later_ms - earlier_ms) / 1000.0 : 0.0;
}

std::string MergeDetails(const std::string& stage_details, const model::Attributes& metadata) {
  auto details = model::ParseObject(stage_details);
  for (const auto& [key, value] : metadata) {
    (*details.mutable_fields())[key] = model::ToProtoValue(value);
  }
  return model::PrintObject(details);
}

} // namespace

TransitionEngine::TransitionEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventEmitter> emitter,
                                   std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), emitter_(std::move(emitter)), clock_(std::move(clock)) {
}

bool TransitionEngine::Transition(const TransitionRequest& request) {
  auto tx      = repository_->Begin();
  auto applied = Apply(*tx, request);
  if (!applied) {
    tx->Rollback();
    WORKFLOW_LOG_DEBUG("transition skipped: state changed concurrently", {observability::StringField("workflow_id", request.workflow_id),
                                                                            observability::StateField("expected", request.from)});
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(request.from, request.to);
  return true;
}

std::optional<db::model::WorkflowRecord> TransitionEngine::Apply(db::Transaction& tx, const TransitionRequest& request,
                                                                 const RecordMutator& mutator) {
  if (!model::CanTransition(request.from, request.to)) {
    throw util::InvalidState("transition " + std::string(model::ToString(request.from)) + " -> " + std::string(model::ToString(request.to)) +
                             " is not allowed");
  }

  auto record = repository_->LockWorkflow(tx, request.workflow_id);
  if (!record) throw util::NotFound("transition: workflow " + request.workflow_id + " not found");
  if (record->state != request.from) return std::nullopt;

  const auto previous = *record;
  if (mutator) {
    mutator(*record);
    if (record->state != previous.state || record->version != previous.version) {
      throw util::InvalidState("transition: row mutator changed state or version of " + request.workflow_id);
    }
  }

  const uint64_t now = clock_->NowMillis();

  record->state = request.to;
  record->version += 1;
  if (request.stage) record->stage = *request.stage;
  if (!request.metadata.empty()) record->stage_details = MergeDetails(record->stage_details, request.metadata);

  if (request.to == WorkflowState::kQueued && !record->queued_at_ms) record->queued_at_ms = now;
  if (request.to == WorkflowState::kProcessing && request.from != WorkflowState::kProcessing) record->processing_started_at_ms = now;
  if (model::IsFinished(request.to)) {
    record->completed_at_ms = now;
  } else if (model::IsFinished(request.from)) {
    // Leaving failed for another attempt reopens the item.
    record->completed_at_ms.reset();
  }

  // Counted once per entry; a status refresh while parked stamps nothing.
  if (request.to == WorkflowState::kQuotaExceeded && request.from != WorkflowState::kQuotaExceeded) {
    record->quota_exceeded_count += 1;
    record->last_quota_check_ms = now;
  }
  record->state_entered_at_ms = now;

  db::ThrowIfDbError(repository_->UpdateWorkflow(tx, *record), "transition");

  db::model::TransitionRecord audit;
  audit.transition_id = util::NewId();
  audit.workflow_id   = record->id;
  audit.from_state    = request.from;
  audit.to_state      = request.to;
  audit.stage         = record->stage;
  audit.reason        = request.reason.value_or("");
  audit.metadata      = model::EncodeAttributes(request.metadata);
  audit.actor         = request.actor;
  audit.created_at_ms = now;
  db::ThrowIfDbError(repository_->InsertTransition(tx, audit), "record transition");

  model::StateChanged changed;
  changed.transition_id = audit.transition_id;
  changed.from_state    = request.from;
  changed.to_state      = request.to;
  changed.stage         = audit.stage;
  changed.reason        = audit.reason;
  emitter_->Emit(tx, record->id, changed);

  const double in_state = SecondsBetween(previous.state_entered_at_ms, now);
  emitter_->RecordMetric(tx, record->id, "state_duration", model::ToString(request.from), in_state,
                         {{"to_state", std::string(model::ToString(request.to))}});
  if (request.stage && !previous.stage.empty() && previous.stage != *request.stage) {
    emitter_->RecordMetric(tx, record->id, "stage_duration", previous.stage, in_state, {{"next_stage", *request.stage}});
  }

  return record;
}

} // namespace workflow::core
