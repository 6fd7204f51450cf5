#include "lease_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace workflow::lease {

LeaseManager::LeaseManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventEmitter> emitter,
                           std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), emitter_(std::move(emitter)), clock_(std::move(clock)) {
}

bool LeaseManager::IsStale(const db::model::WorkflowRecord& record, std::chrono::seconds timeout) const {
  if (!record.lease_holder) return false;
  if (!record.lease_acquired_at_ms) return true;

  const auto age = clock_->Now() - util::FromUnixMillis(*record.lease_acquired_at_ms);
  return age > timeout;
}

Grant LeaseManager::TryGrant(db::Transaction& tx, db::model::WorkflowRecord& record, const std::string& worker_id, std::chrono::seconds timeout) {
  if (worker_id.empty()) throw std::invalid_argument("lease: worker id must not be empty");
  if (timeout.count() <= 0) throw std::invalid_argument("lease: timeout must be positive");

  Grant              grant = Grant::kAcquired;
  model::LeaseChanged change;
  change.worker_id = worker_id;

  if (!record.lease_holder) {
    change.change = model::LeaseChange::kAcquired;
  } else if (*record.lease_holder == worker_id) {
    grant         = Grant::kRenewed;
    change.change = model::LeaseChange::kAcquired;
  } else if (IsStale(record, timeout)) {
    grant                  = Grant::kTakenOver;
    change.change          = model::LeaseChange::kTakenOver;
    change.previous_holder = *record.lease_holder;
  } else {
    observability::Metrics::Instance().RecordLeaseDenied();
    WORKFLOW_LOG_DEBUG("lease denied", {observability::StringField("workflow_id", record.id), observability::StringField("worker_id", worker_id),
                                        observability::StringField("holder", *record.lease_holder)});
    return Grant::kDenied;
  }

  record.lease_holder         = worker_id;
  record.lease_acquired_at_ms = clock_->NowMillis();

  // Renewals only refresh the timestamp.
  if (grant != Grant::kRenewed) {
    emitter_->Emit(tx, record.id, change);
  }
  if (grant == Grant::kTakenOver) {
    WORKFLOW_LOG_WARN("stale lease taken over", {observability::StringField("workflow_id", record.id), observability::StringField("worker_id", worker_id),
                                                 observability::StringField("previous_holder", change.previous_holder)});
  }
  return grant;
}

bool LeaseManager::Revoke(db::Transaction& tx, db::model::WorkflowRecord& record, const std::string& worker_id) {
  if (!record.lease_holder || *record.lease_holder != worker_id) return false;

  record.lease_holder.reset();
  record.lease_acquired_at_ms.reset();

  model::LeaseChanged change;
  change.change    = model::LeaseChange::kReleased;
  change.worker_id = worker_id;
  emitter_->Emit(tx, record.id, change);
  return true;
}

void LeaseManager::RequireHolderOrUnleased(const db::model::WorkflowRecord& record, const std::string& worker_id) {
  if (record.lease_holder && *record.lease_holder != worker_id) {
    throw util::LeaseConflict("workflow " + record.id + " is leased by " + *record.lease_holder + ", not " + worker_id);
  }
}

bool LeaseManager::AcquireLease(const std::string& workflow_id, const std::string& worker_id, std::chrono::seconds timeout) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("acquire lease: workflow " + workflow_id + " not found");

  if (TryGrant(*tx, *record, worker_id, timeout) == Grant::kDenied) {
    tx->Rollback();
    return false;
  }

  db::ThrowIfDbError(repository_->UpdateWorkflow(*tx, *record), "acquire lease");
  tx->Commit();
  return true;
}

bool LeaseManager::ReleaseLease(const std::string& workflow_id, const std::string& worker_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockWorkflow(*tx, workflow_id);
  if (!record) throw util::NotFound("release lease: workflow " + workflow_id + " not found");

  if (!Revoke(*tx, *record, worker_id)) {
    tx->Rollback();
    return false;
  }

  db::ThrowIfDbError(repository_->UpdateWorkflow(*tx, *record), "release lease");
  tx->Commit();
  return true;
}

std::optional<std::string> LeaseManager::HolderOf(const std::string& workflow_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetWorkflow(*tx, workflow_id);
  tx->Commit();
  if (!record) throw util::NotFound("lease holder: workflow " + workflow_id + " not found");
  return record->lease_holder;
}

} // namespace workflow::lease
