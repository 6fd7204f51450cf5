#include "retry_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace workflow::retry {

using model::WorkflowState;

namespace {

// 2^30 base delays is far past any sane schedule.
constexpr int kMaxBackoffShift = 30;

void RequireJsonObject(const std::string& json, const char* what) {
  if (!model::IsJsonObject(json)) throw std::invalid_argument(std::string(what) + " must be a JSON object");
}

} // namespace

std::string_view ToString(FailureKind kind) {
  return kind == FailureKind::kTransient ? "transient" : "permanent";
}

std::string_view ToString(FailureOutcome outcome) {
  switch (outcome) {
    case FailureOutcome::kNotProcessing:
      return "not_processing";
    case FailureOutcome::kRetryScheduled:
      return "retry_scheduled";
    case FailureOutcome::kDeadLettered:
      return "dead_lettered";
  }
  return "unknown";
}

RetryScheduler::RetryScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::TransitionEngine> engine,
                               std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<quota::QuotaTracker> quota,
                               std::shared_ptr<deadletter::DeadLetterStore> deadletters, std::shared_ptr<events::EventEmitter> emitter,
                               std::shared_ptr<const util::Clock> clock, Options options)
    : repository_(std::move(repository)),
      engine_(std::move(engine)),
      leases_(std::move(leases)),
      quota_(std::move(quota)),
      deadletters_(std::move(deadletters)),
      emitter_(std::move(emitter)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.base_delay.count() <= 0) throw std::invalid_argument("retry scheduler: base delay must be positive");
}

std::chrono::seconds RetryScheduler::BackoffDelay(int retry_count) const {
  const int shift = std::clamp(retry_count, 0, kMaxBackoffShift);
  return options_.base_delay * (int64_t{1} << shift);
}

FailureOutcome RetryScheduler::OnFailure(const std::string& workflow_id, const std::string& worker_id, const std::string& error,
                                         FailureKind kind) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("report failure: workflow " + workflow_id + " not found");
  lease::LeaseManager::RequireHolderOrUnleased(*record, worker_id);

  if (record->state != WorkflowState::kProcessing) {
    tx->Rollback();
    WORKFLOW_LOG_DEBUG("failure ignored: item not processing",
                       {observability::StringField("workflow_id", workflow_id), observability::StateField("state", record->state)});
    return FailureOutcome::kNotProcessing;
  }

  const int      attempts  = record->retry_count;
  const bool     retryable = kind == FailureKind::kTransient && attempts < record->max_retries;
  const uint64_t now       = clock_->NowMillis();
  const auto     delay     = BackoffDelay(attempts);

  auto release = [&](db::model::WorkflowRecord& row) {
    if (kind == FailureKind::kTransient) row.retry_count = attempts + 1;
    row.last_error = error;
    leases_->Revoke(*tx, row, worker_id);
  };

  core::TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kProcessing;
  request.actor       = worker_id;
  request.metadata    = {{"error", error}, {"failure_kind", std::string(ToString(kind))}};

  FailureOutcome outcome;
  if (retryable) {
    const uint64_t next_retry_at = now + static_cast<uint64_t>(delay.count()) * 1000;

    request.to     = WorkflowState::kQueued;
    request.reason = "retry scheduled";
    auto applied   = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
      release(row);
      row.next_retry_at_ms = next_retry_at;
    });
    if (!applied) {
      tx->Rollback();
      return FailureOutcome::kNotProcessing;
    }

    model::RetryScheduled scheduled;
    scheduled.retry_count      = applied->retry_count;
    scheduled.max_retries      = applied->max_retries;
    scheduled.delay_seconds    = delay.count();
    scheduled.next_retry_at_ms = next_retry_at;
    scheduled.error            = error;
    emitter_->Emit(*tx, workflow_id, scheduled);
    outcome = FailureOutcome::kRetryScheduled;
  } else {
    request.to     = WorkflowState::kFailed;
    request.reason = kind == FailureKind::kPermanent ? "permanent failure" : "retries exhausted";
    auto applied   = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
      release(row);
      row.next_retry_at_ms.reset();
    });
    if (!applied) {
      tx->Rollback();
      return FailureOutcome::kNotProcessing;
    }

    const auto entry = deadletters_->Record(*tx, workflow_id, deadletter::DeadLetterStore::Snapshot(*applied), error,
                                            {{"failure_kind", std::string(ToString(kind))},
                                             {"retry_count", static_cast<std::int64_t>(applied->retry_count)},
                                             {"max_retries", static_cast<std::int64_t>(applied->max_retries)},
                                             {"stage", applied->stage},
                                             {"worker_id", worker_id}});

    model::DeadLettered dead;
    dead.deadletter_id = entry.deadletter_id;
    dead.failure_count = entry.failure_count;
    dead.permanent     = kind == FailureKind::kPermanent;
    dead.error         = error;
    emitter_->Emit(*tx, workflow_id, dead);
    outcome = FailureOutcome::kDeadLettered;
  }

  emitter_->RecordMetric(*tx, workflow_id, "error", ToString(kind), 1.0, {{"error", error}, {"outcome", std::string(ToString(outcome))}});
  tx->Commit();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordTransition(WorkflowState::kProcessing, request.to);
  if (outcome == FailureOutcome::kRetryScheduled) {
    metrics.RecordRetry(attempts + 1);
    WORKFLOW_LOG_INFO("retry scheduled", {observability::StringField("workflow_id", workflow_id), observability::IntField("retry_count", attempts + 1),
                                          observability::IntField("delay_seconds", delay.count())});
  } else {
    metrics.RecordDeadLetter(kind == FailureKind::kPermanent);
    WORKFLOW_LOG_WARN("workflow dead-lettered", {observability::StringField("workflow_id", workflow_id),
                                                 observability::StringField("failure_kind", ToString(kind)), observability::StringField("error", error)});
  }
  return outcome;
}

bool RetryScheduler::OnQuotaExceeded(const std::string& workflow_id, const std::string& worker_id, const std::string& service_name,
                                     const std::optional<std::string>& partial_results) {
  if (partial_results) RequireJsonObject(*partial_results, "partial results");

  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("report quota exceeded: workflow " + workflow_id + " not found");
  lease::LeaseManager::RequireHolderOrUnleased(*record, worker_id);

  const auto check = quota_->CheckQuota(*tx, service_name);
  const auto now   = clock_->Now();

  core::TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kProcessing;
  request.to          = WorkflowState::kQuotaExceeded;
  request.reason      = "quota exceeded: " + service_name;
  request.actor       = worker_id;
  request.metadata    = {{"quota_exceeded_at", util::FormatIso8601(now)},
                         {"estimated_wait_seconds", check.wait_seconds},
                         {"quota_service", service_name}};

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    row.next_retry_at_ms = util::ToUnixMillis(check.reset_at);
    if (partial_results) row.partial_results = *partial_results;
    leases_->Revoke(*tx, row, worker_id);
  });
  if (!applied) {
    tx->Rollback();
    return false;
  }

  model::QuotaExhausted exhausted;
  exhausted.service_name       = service_name;
  exhausted.quota_types        = check.exhausted_types;
  exhausted.estimated_reset_ms = util::ToUnixMillis(check.reset_at);
  exhausted.wait_seconds       = check.wait_seconds;
  emitter_->Emit(*tx, workflow_id, exhausted);
  tx->Commit();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordTransition(request.from, request.to);
  metrics.RecordQuotaExceeded(service_name);
  WORKFLOW_LOG_INFO("workflow parked on quota", {observability::StringField("workflow_id", workflow_id), observability::StringField("service", service_name),
                                                 observability::IntField("wait_seconds", check.wait_seconds)});
  return true;
}

bool RetryScheduler::RefreshQuotaStatus(const std::string& workflow_id, const std::string& service_name) {
  auto       tx    = repository_->Begin();
  const auto check = quota_->CheckQuota(*tx, service_name);

  core::TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kQuotaExceeded;
  request.to          = WorkflowState::kQuotaExceeded;
  request.reason      = "quota status refresh";
  request.metadata    = {{"estimated_wait_seconds", check.wait_seconds}, {"quota_service", service_name}};

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) { row.next_retry_at_ms = util::ToUnixMillis(check.reset_at); });
  if (!applied) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(request.from, request.to);
  return true;
}

bool RetryScheduler::OnPartialProgress(const std::string& workflow_id, const std::string& worker_id, const std::string& partial_results,
                                       const std::string& stage, std::chrono::seconds resume_after) {
  RequireJsonObject(partial_results, "partial results");
  if (resume_after.count() < 0) throw std::invalid_argument("partial progress: resume delay must not be negative");

  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("report partial progress: workflow " + workflow_id + " not found");
  lease::LeaseManager::RequireHolderOrUnleased(*record, worker_id);

  const uint64_t resume_at = util::ToUnixMillis(clock_->Now() + resume_after);

  core::TransitionRequest request;
  request.workflow_id = workflow_id;
  request.from        = WorkflowState::kProcessing;
  request.to          = WorkflowState::kPartiallyProcessed;
  request.stage       = stage;
  request.reason      = "partial progress";
  request.actor       = worker_id;

  auto applied = engine_->Apply(*tx, request, [&](db::model::WorkflowRecord& row) {
    row.partial_results  = partial_results;
    row.next_retry_at_ms = resume_at;
    leases_->Revoke(*tx, row, worker_id);
  });
  if (!applied) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(request.from, request.to);
  return true;
}

std::size_t RetryScheduler::ResumeEligible(std::size_t limit) {
  db::WorkflowFilter filter;
  filter.states          = {WorkflowState::kQuotaExceeded, WorkflowState::kPartiallyProcessed};
  filter.retry_due_at_ms = clock_->NowMillis();
  filter.limit           = limit;

  std::vector<db::model::WorkflowRecord> due;
  {
    auto tx = repository_->Begin();
    due     = repository_->ListWorkflows(*tx, filter);
    tx->Commit();
  }

  std::size_t resumed = 0;
  for (const auto& item : due) {
    core::TransitionRequest request;
    request.workflow_id = item.id;
    request.from        = item.state;
    request.to          = WorkflowState::kQueued;
    request.reason      = "resume after wait";

    auto tx      = repository_->Begin();
    auto applied = engine_->Apply(*tx, request, [](db::model::WorkflowRecord& row) { row.next_retry_at_ms.reset(); });
    if (!applied) {
      // Moved on since listing.
      tx->Rollback();
      continue;
    }
    tx->Commit();

    observability::Metrics::Instance().RecordTransition(request.from, request.to);
    ++resumed;
  }

  if (resumed > 0) {
    WORKFLOW_LOG_INFO("parked workflows resumed", {observability::IntField("count", static_cast<std::int64_t>(resumed))});
  }
  return resumed;
}

} // namespace workflow::retry
