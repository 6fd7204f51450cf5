#include "workflow_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workflow::core {

using model::WorkflowState;

namespace {

void ReleaseAnyLease(lease::LeaseManager& leases, db::Transaction& tx, db::model::WorkflowRecord& row) {
  if (row.lease_holder) leases.Revoke(tx, row, *row.lease_holder);
}

} // namespace

WorkflowManager::WorkflowManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<TransitionEngine> engine,
                                 std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<quota::QuotaTracker> quota,
                                 std::shared_ptr<retry::RetryScheduler> scheduler, std::shared_ptr<deadletter::DeadLetterStore> deadletters,
                                 std::shared_ptr<events::EventEmitter> emitter, std::shared_ptr<const util::Clock> clock, Options options)
    : repository_(std::move(repository)),
      engine_(std::move(engine)),
      leases_(std::move(leases)),
      quota_(std::move(quota)),
      scheduler_(std::move(scheduler)),
      deadletters_(std::move(deadletters)),
      emitter_(std::move(emitter)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.default_max_retries < 0) throw std::invalid_argument("workflow manager: default max retries must not be negative");
  if (options_.lease_timeout.count() <= 0) throw std::invalid_argument("workflow manager: lease timeout must be positive");
}

// ---------------------------------------------------------------------
// Producer
// ---------------------------------------------------------------------

std::string WorkflowManager::Insert(const std::string& payload, int priority, std::optional<int> max_retries, bool queue) {
  const std::string body = payload.empty() ? "{}" : payload;
  if (!model::IsJsonObject(body)) throw std::invalid_argument("enqueue: payload must be a JSON object");
  const int retries = max_retries.value_or(options_.default_max_retries);
  if (retries < 0) throw std::invalid_argument("enqueue: max retries must not be negative");

  const uint64_t now = clock_->NowMillis();

  db::model::WorkflowRecord record;
  record.id                  = util::NewId();
  record.state               = WorkflowState::kCreated;
  record.version             = 1;
  record.priority            = priority;
  record.max_retries         = retries;
  record.payload             = body;
  record.created_at_ms       = now;
  record.state_entered_at_ms = now;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertWorkflow(*tx, record), "enqueue");

  model::Enqueued enqueued;
  enqueued.priority    = priority;
  enqueued.max_retries = retries;
  emitter_->Emit(*tx, record.id, enqueued);

  if (queue) {
    TransitionRequest request;
    request.workflow_id = record.id;
    request.from        = WorkflowState::kCreated;
    request.to          = WorkflowState::kQueued;
    request.reason      = "enqueued";
    request.actor       = "producer";
    engine_->Apply(*tx, request);
  }
  tx->Commit();

  if (queue) observability::Metrics::Instance().RecordTransition(WorkflowState::kCreated, WorkflowState::kQueued);
  WORKFLOW_LOG_DEBUG("workflow enqueued", {observability::StringField("workflow_id", record.id), observability::IntField("priority", priority),
                                           observability::BoolField("queued", queue)});
  return record.id;
}

std::string WorkflowManager::Enqueue(const std::string& payload, int priority, std::optional<int> max_retries) {
  return Insert(payload, priority, max_retries, false);
}

std::string WorkflowManager::EnqueueAndQueue(const std::string& payload, int priority, std::optional<int> max_retries) {
  return Insert(payload, priority, max_retries, true);
}

// ---------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------

std::optional<db::model::WorkflowRecord> WorkflowManager::ClaimNext(const std::string& worker_id, std::optional<std::chrono::seconds> lease_timeout) {
  if (worker_id.empty()) throw std::invalid_argument("claim: worker id must not be empty");
  const auto timeout = lease_timeout.value_or(options_.lease_timeout);
  const auto started = std::chrono::steady_clock::now();

  const uint64_t now     = clock_->NowMillis();
  const uint64_t span_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());

  db::ClaimCriteria criteria;
  criteria.now_ms          = now;
  criteria.lease_cutoff_ms = now > span_ms ? now - span_ms : 0;

  auto tx        = repository_->Begin();
  auto candidate = repository_->LockNextClaimable(*tx, criteria);
  if (!candidate) {
    tx->Rollback();
    return std::nullopt;
  }

  TransitionRequest request;
  request.workflow_id = candidate->id;
  request.from        = WorkflowState::kQueued;
  request.to          = WorkflowState::kProcessing;
  request.reason      = "claimed";
  request.actor       = worker_id;

  auto claimed = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    if (leases_->TryGrant(*tx, row, worker_id, timeout) == lease::Grant::kDenied) {
      throw util::LeaseConflict("claim: live lease on " + row.id + " held by " + row.lease_holder.value_or(""));
    }
  });
  if (!claimed) {
    tx->Rollback();
    return std::nullopt;
  }
  tx->Commit();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordTransition(request.from, request.to);
  metrics.ObserveClaimLatencyMs(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
  WORKFLOW_LOG_DEBUG("workflow claimed", {observability::StringField("workflow_id", claimed->id), observability::StringField("worker_id", worker_id)});
  return claimed;
}

bool WorkflowManager::AdvanceStage(const std::string& workflow_id, const std::string& worker_id, const std::string& stage,
                                   const model::Attributes& details) {
  if (stage.empty()) throw std::invalid_argument("advance stage: stage must not be empty");

  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("advance stage: workflow " + workflow_id + " not found");
  lease::LeaseManager::RequireHolderOrUnleased(*record, worker_id);

  TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kProcessing;
  request.to          = WorkflowState::kProcessing;
  request.stage       = stage;
  request.reason      = "stage advanced";
  request.metadata    = details;
  request.actor       = worker_id;

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    if (row.lease_holder) row.lease_acquired_at_ms = clock_->NowMillis();
  });
  if (!applied) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(request.from, request.to);
  return true;
}

bool WorkflowManager::Complete(const std::string& workflow_id, const std::string& worker_id, const model::Attributes& details) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("complete: workflow " + workflow_id + " not found");
  lease::LeaseManager::RequireHolderOrUnleased(*record, worker_id);

  TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kProcessing;
  request.to          = WorkflowState::kCompleted;
  request.reason      = "completed";
  request.metadata    = details;
  request.actor       = worker_id;

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    row.next_retry_at_ms.reset();
    leases_->Revoke(*tx, row, worker_id);
  });
  if (!applied) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(request.from, request.to);
  WORKFLOW_LOG_INFO("workflow completed", {observability::StringField("workflow_id", workflow_id), observability::StringField("worker_id", worker_id)});
  return true;
}

retry::FailureOutcome WorkflowManager::Fail(const std::string& workflow_id, const std::string& worker_id, const std::string& error,
                                            retry::FailureKind kind) {
  return scheduler_->OnFailure(workflow_id, worker_id, error, kind);
}

bool WorkflowManager::ReportQuotaExceeded(const std::string& workflow_id, const std::string& worker_id, const std::string& service_name,
                                          const std::optional<std::string>& partial_results) {
  return scheduler_->OnQuotaExceeded(workflow_id, worker_id, service_name, partial_results);
}

bool WorkflowManager::ReportPartialProgress(const std::string& workflow_id, const std::string& worker_id, const std::string& partial_results,
                                            const std::string& stage, std::chrono::seconds resume_after) {
  return scheduler_->OnPartialProgress(workflow_id, worker_id, partial_results, stage, resume_after);
}

std::optional<db::model::WorkflowRecord> WorkflowManager::ReclaimStale(const std::string& worker_id,
                                                                       std::optional<std::chrono::seconds> lease_timeout) {
  if (worker_id.empty()) throw std::invalid_argument("reclaim: worker id must not be empty");
  const auto timeout = lease_timeout.value_or(options_.lease_timeout);

  db::WorkflowFilter filter;
  filter.states = {WorkflowState::kProcessing};

  std::vector<db::model::WorkflowRecord> processing;
  {
    auto tx    = repository_->Begin();
    processing = repository_->ListWorkflows(*tx, filter);
    tx->Commit();
  }

  for (const auto& item : processing) {
    if (item.lease_holder && !leases_->IsStale(item, timeout)) continue;

    auto tx     = repository_->Begin();
    auto record = repository_->LockWorkflow(*tx, item.id);
    if (!record || record->state != WorkflowState::kProcessing || (record->lease_holder && !leases_->IsStale(*record, timeout))) {
      tx->Rollback();
      continue;
    }

    if (leases_->TryGrant(*tx, *record, worker_id, timeout) == lease::Grant::kDenied) {
      tx->Rollback();
      continue;
    }
    db::ThrowIfDbError(repository_->UpdateWorkflow(*tx, *record), "reclaim stale workflow");
    tx->Commit();
    return record;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------
// Operator
// ---------------------------------------------------------------------

bool WorkflowManager::OperatorTransition(const std::string& workflow_id, const StateSet& allowed_from, WorkflowState to, const std::string& reason,
                                         const std::string& actor, const TransitionEngine::RecordMutator& mutator) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("workflow " + workflow_id + " not found");

  const auto from = record->state;
  if (std::find(allowed_from.begin(), allowed_from.end(), from) == allowed_from.end()) {
    throw util::InvalidState("cannot move workflow " + workflow_id + " from " + std::string(model::ToString(from)) + " to " +
                             std::string(model::ToString(to)));
  }

  TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = from;
  request.to          = to;
  request.reason      = reason;
  request.actor       = actor;

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    if (mutator) mutator(row);
    if (to == WorkflowState::kCancelled || to == WorkflowState::kSuspended) ReleaseAnyLease(*leases_, *tx, row);
  });
  if (!applied) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(from, to);
  WORKFLOW_LOG_INFO("operator transition", {observability::StringField("workflow_id", workflow_id), observability::StateField("from", from),
                                            observability::StateField("to", to), observability::StringField("actor", actor)});
  return true;
}

bool WorkflowManager::Retry(const std::string& workflow_id, const std::string& actor) {
  return OperatorTransition(workflow_id, {WorkflowState::kFailed}, WorkflowState::kQueued, "manual retry", actor, [](db::model::WorkflowRecord& row) {
    row.retry_count = 0;
    row.next_retry_at_ms.reset();
  });
}

bool WorkflowManager::Cancel(const std::string& workflow_id, const std::string& reason, const std::string& actor) {
  return OperatorTransition(workflow_id,
                            {WorkflowState::kCreated, WorkflowState::kQueued, WorkflowState::kQuotaExceeded, WorkflowState::kPartiallyProcessed,
                             WorkflowState::kFailed, WorkflowState::kSuspended},
                            WorkflowState::kCancelled, reason, actor, [](db::model::WorkflowRecord& row) { row.next_retry_at_ms.reset(); });
}

bool WorkflowManager::Suspend(const std::string& workflow_id, const std::string& reason, const std::string& actor) {
  return OperatorTransition(workflow_id, {WorkflowState::kQueued, WorkflowState::kProcessing, WorkflowState::kQuotaExceeded},
                            WorkflowState::kSuspended, reason, actor, {});
}

bool WorkflowManager::Resume(const std::string& workflow_id, const std::string& actor) {
  return OperatorTransition(workflow_id, {WorkflowState::kSuspended}, WorkflowState::kQueued, "resumed", actor,
                            [](db::model::WorkflowRecord& row) { row.next_retry_at_ms.reset(); });
}

bool WorkflowManager::ResumeQuotaExceeded(const std::string& workflow_id, const std::string& actor) {
  return OperatorTransition(workflow_id, {WorkflowState::kQuotaExceeded}, WorkflowState::kQueued, "quota wait overridden", actor,
                            [](db::model::WorkflowRecord& row) { row.next_retry_at_ms.reset(); });
}

std::size_t WorkflowManager::ResumeEligible(std::size_t limit) {
  return scheduler_->ResumeEligible(limit);
}

// ---------------------------------------------------------------------
// Read side
// ---------------------------------------------------------------------

std::optional<db::model::WorkflowRecord> WorkflowManager::Get(const std::string& workflow_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetWorkflow(*tx, workflow_id);
  tx->Commit();
  return record;
}

std::vector<db::model::TransitionRecord> WorkflowManager::History(const std::string& workflow_id) {
  auto tx      = repository_->Begin();
  auto history = repository_->ListTransitions(*tx, workflow_id);
  tx->Commit();
  return history;
}

std::vector<db::model::EventRecord> WorkflowManager::Events(const std::string& workflow_id) {
  return emitter_->ForWorkflow(workflow_id);
}

std::vector<db::model::EventRecord> WorkflowManager::UnprocessedEvents(std::size_t limit) {
  return emitter_->Unprocessed(limit);
}

void WorkflowManager::MarkEventProcessed(const std::string& event_id) {
  emitter_->MarkProcessed(event_id);
}

std::vector<db::model::WorkflowRecord> WorkflowManager::QuotaExceededBacklog(std::size_t limit) {
  db::WorkflowFilter filter;
  filter.states = {WorkflowState::kQuotaExceeded, WorkflowState::kPartiallyProcessed};

  auto tx      = repository_->Begin();
  auto backlog = repository_->ListWorkflows(*tx, filter);
  tx->Commit();

  std::stable_sort(backlog.begin(), backlog.end(), [](const auto& a, const auto& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.queued_at_ms.value_or(0) < b.queued_at_ms.value_or(0);
  });
  if (limit > 0 && backlog.size() > limit) backlog.resize(limit);
  return backlog;
}

std::vector<db::model::DeadLetterRecord> WorkflowManager::DeadLetters(bool unresolved_only) {
  return deadletters_->List(unresolved_only);
}

} // namespace workflow::core
