#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/util/time.hpp"

namespace workflow::lease {

enum class Grant {
  kDenied,
  kAcquired,
  kRenewed,
  kTakenOver,
};

/*
  LeaseManager

  Time-bounded processing leases stored on the item row
  (lease_holder, lease_acquired_at). A lease is granted when:
    - nobody holds it
    - the holder's lease is older than the timeout (stale takeover)
    - the requesting worker already holds it (renewal)

  Every decision is a locked read-modify-write, so two acquirers never
  both win. Leases never touch state or version.
*/
class LeaseManager {
 public:
  LeaseManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventEmitter> emitter,
               std::shared_ptr<const util::Clock> clock);

  bool AcquireLease(const std::string& workflow_id, const std::string& worker_id, std::chrono::seconds timeout);
  bool ReleaseLease(const std::string& workflow_id, const std::string& worker_id);

  std::optional<std::string> HolderOf(const std::string& workflow_id);

  // In-transaction helpers. They change the lease columns of `record`
  // and emit the lease event; persisting the row is the caller's job.
  Grant TryGrant(db::Transaction& tx, db::model::WorkflowRecord& record, const std::string& worker_id, std::chrono::seconds timeout);
  bool  Revoke(db::Transaction& tx, db::model::WorkflowRecord& record, const std::string& worker_id);

  bool IsStale(const db::model::WorkflowRecord& record, std::chrono::seconds timeout) const;

  // Throws util::LeaseConflict when a different worker holds the lease.
  static void RequireHolderOrUnleased(const db::model::WorkflowRecord& record, const std::string& worker_id);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<events::EventEmitter> emitter_;
  std::shared_ptr<const util::Clock>    clock_;
};

} // namespace workflow::lease
