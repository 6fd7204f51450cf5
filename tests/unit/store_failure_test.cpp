#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/transition_engine.hpp"
#include "internal/core/workflow_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deadletter/deadletter_store.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/quota/quota_tracker.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::db::ErrorCode;
using workflow::db::Result;
using workflow::db::Transaction;
using workflow::model::WorkflowState;
using workflow::retry::FailureKind;
using workflow::util::FromUnixMillis;
using workflow::util::ManualClock;

namespace dbm = workflow::db::model;

/*
  Memory store whose audit writes can be switched to fail, standing in
  for a backend that drops its connection halfway through a transaction.
*/
class FailingRepository final : public workflow::db::Repository {
 public:
  bool        fail_transitions  = false;
  bool        fail_dead_letters = false;
  bool        fail_events       = false;
  std::string fail_event_type; // empty = every event type

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertWorkflow(Transaction& tx, const dbm::WorkflowRecord& record) override {
    return inner_.InsertWorkflow(tx, record);
  }
  std::optional<dbm::WorkflowRecord> GetWorkflow(Transaction& tx, const std::string& id) override {
    return inner_.GetWorkflow(tx, id);
  }
  std::optional<dbm::WorkflowRecord> LockWorkflow(Transaction& tx, const std::string& id) override {
    return inner_.LockWorkflow(tx, id);
  }
  std::optional<dbm::WorkflowRecord> LockNextClaimable(Transaction& tx, const workflow::db::ClaimCriteria& criteria) override {
    return inner_.LockNextClaimable(tx, criteria);
  }
  Result UpdateWorkflow(Transaction& tx, const dbm::WorkflowRecord& record) override {
    return inner_.UpdateWorkflow(tx, record);
  }
  std::vector<dbm::WorkflowRecord> ListWorkflows(Transaction& tx, const workflow::db::WorkflowFilter& filter) override {
    return inner_.ListWorkflows(tx, filter);
  }

  Result InsertTransition(Transaction& tx, dbm::TransitionRecord& record) override {
    if (fail_transitions) return Result::Err(ErrorCode::Unavailable, "connection reset");
    return inner_.InsertTransition(tx, record);
  }
  std::vector<dbm::TransitionRecord> ListTransitions(Transaction& tx, const std::string& id) override {
    return inner_.ListTransitions(tx, id);
  }
  std::vector<dbm::TransitionRecord> ListTransitionsSince(Transaction& tx, uint64_t since_ms) override {
    return inner_.ListTransitionsSince(tx, since_ms);
  }

  Result InsertEvent(Transaction& tx, dbm::EventRecord& record) override {
    if (fail_events && (fail_event_type.empty() || fail_event_type == record.event_type)) {
      return Result::Err(ErrorCode::IOError, "disk full");
    }
    return inner_.InsertEvent(tx, record);
  }
  std::vector<dbm::EventRecord> ListEvents(Transaction& tx, const std::string& id) override {
    return inner_.ListEvents(tx, id);
  }
  std::vector<dbm::EventRecord> ListUnprocessedEvents(Transaction& tx, std::size_t limit) override {
    return inner_.ListUnprocessedEvents(tx, limit);
  }
  Result MarkEventProcessed(Transaction& tx, const std::string& event_id) override {
    return inner_.MarkEventProcessed(tx, event_id);
  }

  Result InsertMetric(Transaction& tx, const dbm::MetricRecord& record) override {
    return inner_.InsertMetric(tx, record);
  }
  std::vector<dbm::MetricRecord> ListMetrics(Transaction& tx, const std::string& type, uint64_t since_ms) override {
    return inner_.ListMetrics(tx, type, since_ms);
  }

  Result InsertDeadLetter(Transaction& tx, const dbm::DeadLetterRecord& record) override {
    if (fail_dead_letters) return Result::Err(ErrorCode::Unavailable, "connection reset");
    return inner_.InsertDeadLetter(tx, record);
  }
  Result UpdateDeadLetter(Transaction& tx, const dbm::DeadLetterRecord& record) override {
    return inner_.UpdateDeadLetter(tx, record);
  }
  std::optional<dbm::DeadLetterRecord> GetDeadLetter(Transaction& tx, const std::string& id) override {
    return inner_.GetDeadLetter(tx, id);
  }
  std::optional<dbm::DeadLetterRecord> GetDeadLetterByWorkflow(Transaction& tx, const std::string& id) override {
    return inner_.GetDeadLetterByWorkflow(tx, id);
  }
  std::vector<dbm::DeadLetterRecord> ListDeadLetters(Transaction& tx) override {
    return inner_.ListDeadLetters(tx);
  }

  Result InsertQuotaUsage(Transaction& tx, dbm::QuotaUsageRecord& record) override {
    return inner_.InsertQuotaUsage(tx, record);
  }
  std::optional<dbm::QuotaUsageRecord> LatestQuotaUsage(Transaction& tx, const std::string& service, uint64_t since_ms) override {
    return inner_.LatestQuotaUsage(tx, service, since_ms);
  }
  std::vector<dbm::QuotaUsageRecord> ListQuotaUsage(Transaction& tx, const std::string& service, uint64_t since_ms) override {
    return inner_.ListQuotaUsage(tx, service, since_ms);
  }
  Result UpsertQuotaLimit(Transaction& tx, const dbm::QuotaLimitRecord& record) override {
    return inner_.UpsertQuotaLimit(tx, record);
  }
  std::optional<dbm::QuotaLimitRecord> GetQuotaLimit(Transaction& tx, const std::string& service, const std::string& type) override {
    return inner_.GetQuotaLimit(tx, service, type);
  }
  std::vector<dbm::QuotaLimitRecord> ListQuotaLimits(Transaction& tx, const std::string& service) override {
    return inner_.ListQuotaLimits(tx, service);
  }

 private:
  workflow::db::memory::MemoryRepository inner_;
};

struct Fixture {
  std::shared_ptr<FailingRepository> repo  = std::make_shared<FailingRepository>();
  std::shared_ptr<ManualClock>       clock = std::make_shared<ManualClock>(FromUnixMillis(1'700'000'000'000));

  std::shared_ptr<workflow::events::EventEmitter>        emitter = std::make_shared<workflow::events::EventEmitter>(repo, clock);
  std::shared_ptr<workflow::core::TransitionEngine>      engine  = std::make_shared<workflow::core::TransitionEngine>(repo, emitter, clock);
  std::shared_ptr<workflow::lease::LeaseManager>         leases  = std::make_shared<workflow::lease::LeaseManager>(repo, emitter, clock);
  std::shared_ptr<workflow::quota::QuotaTracker>         quota   = std::make_shared<workflow::quota::QuotaTracker>(repo, clock);
  std::shared_ptr<workflow::deadletter::DeadLetterStore> deadletters =
      std::make_shared<workflow::deadletter::DeadLetterStore>(repo, clock);
  std::shared_ptr<workflow::retry::RetryScheduler> scheduler = std::make_shared<workflow::retry::RetryScheduler>(
      repo, engine, leases, quota, deadletters, emitter, clock, workflow::retry::RetryScheduler::Options{});
  workflow::core::WorkflowManager manager{repo, engine, leases, quota, scheduler, deadletters, emitter, clock,
                                          workflow::core::WorkflowManager::Options{}};

  // Store contents for one item, read in a fresh transaction.
  struct Footprint {
    dbm::WorkflowRecord record;
    std::size_t         transitions  = 0;
    std::size_t         events       = 0;
    std::size_t         metrics      = 0;
    std::size_t         dead_letters = 0;
  };

  Footprint Snapshot(const std::string& id) {
    auto      tx = repo->Begin();
    Footprint footprint;
    footprint.record       = *repo->GetWorkflow(*tx, id);
    footprint.transitions  = repo->ListTransitions(*tx, id).size();
    footprint.events       = repo->ListEvents(*tx, id).size();
    footprint.metrics      = repo->ListMetrics(*tx, "", 0).size();
    footprint.dead_letters = repo->ListDeadLetters(*tx).size();
    tx->Commit();
    return footprint;
  }
};

template <class E, class F>
bool Throws(F&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void AssertUnchanged(const Fixture::Footprint& before, const Fixture::Footprint& after) {
  assert(after.record.state == before.record.state);
  assert(after.record.version == before.record.version);
  assert(after.record.retry_count == before.record.retry_count);
  assert(after.record.lease_holder == before.record.lease_holder);
  assert(after.record.completed_at_ms == before.record.completed_at_ms);
  assert(after.transitions == before.transitions);
  assert(after.events == before.events);
  assert(after.metrics == before.metrics);
  assert(after.dead_letters == before.dead_letters);
}

workflow::core::TransitionRequest Queue(const std::string& id) {
  workflow::core::TransitionRequest request;
  request.workflow_id = id;
  request.from        = WorkflowState::kCreated;
  request.to          = WorkflowState::kQueued;
  return request;
}

void TestTransitionRollsBackOnEventFailure() {
  Fixture    f;
  const auto id     = f.manager.Enqueue("{}");
  const auto before = f.Snapshot(id);

  f.repo->fail_events = true;
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.engine->Transition(Queue(id)); }));
  AssertUnchanged(before, f.Snapshot(id));

  // The store recovers and the same transition goes through.
  f.repo->fail_events = false;
  assert(f.engine->Transition(Queue(id)));
  const auto after = f.Snapshot(id);
  assert(after.record.state == WorkflowState::kQueued);
  assert(after.record.version == before.record.version + 1);
  assert(after.transitions == before.transitions + 1);
}

void TestTransitionRollsBackOnAuditFailure() {
  Fixture    f;
  const auto id     = f.manager.Enqueue("{}");
  const auto before = f.Snapshot(id);

  f.repo->fail_transitions = true;
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.engine->Transition(Queue(id)); }));
  AssertUnchanged(before, f.Snapshot(id));
}

void TestClaimLeavesNoLease() {
  Fixture    f;
  const auto id     = f.manager.EnqueueAndQueue("{}");
  const auto before = f.Snapshot(id);

  f.repo->fail_events = true;
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.manager.ClaimNext("worker-a"); }));
  const auto after = f.Snapshot(id);
  AssertUnchanged(before, after);
  assert(!after.record.lease_holder);

  f.repo->fail_events = false;
  assert(f.manager.ClaimNext("worker-b")->id == id);
  assert(f.Snapshot(id).record.lease_holder == std::optional<std::string>("worker-b"));
}

void TestDeadLetterWriteFailureKeepsItemProcessing() {
  Fixture    f;
  const auto id = f.manager.EnqueueAndQueue("{}");
  assert(f.manager.ClaimNext("worker-a"));
  const auto before = f.Snapshot(id);

  f.repo->fail_dead_letters = true;
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.manager.Fail(id, "worker-a", "bad input", FailureKind::kPermanent); }));
  const auto after = f.Snapshot(id);
  AssertUnchanged(before, after);
  assert(after.record.state == WorkflowState::kProcessing);
  assert(after.record.lease_holder == std::optional<std::string>("worker-a"));
  assert(!f.deadletters->FindByWorkflow(id));
}

void TestDeadLetterEventFailureDropsEntry() {
  Fixture    f;
  const auto id = f.manager.EnqueueAndQueue("{}", 0, 0);
  assert(f.manager.ClaimNext("worker-a"));
  const auto before = f.Snapshot(id);

  // The dead-letter row is written, then the event after it fails.
  f.repo->fail_events     = true;
  f.repo->fail_event_type = "dead_lettered";
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.manager.Fail(id, "worker-a", "timeout", FailureKind::kTransient); }));
  AssertUnchanged(before, f.Snapshot(id));
  assert(f.deadletters->List(false).empty());

  f.repo->fail_events = false;
  assert(f.manager.Fail(id, "worker-a", "timeout", FailureKind::kTransient) == workflow::retry::FailureOutcome::kDeadLettered);
  const auto after = f.Snapshot(id);
  assert(after.record.state == WorkflowState::kFailed);
  assert(after.record.retry_count == 1);
  assert(after.dead_letters == 1);
}

void TestRetryEventFailureKeepsBudget() {
  Fixture    f;
  const auto id = f.manager.EnqueueAndQueue("{}");
  assert(f.manager.ClaimNext("worker-a"));
  const auto before = f.Snapshot(id);

  f.repo->fail_events     = true;
  f.repo->fail_event_type = "retry_scheduled";
  assert(Throws<workflow::util::StoreUnavailable>([&] { f.manager.Fail(id, "worker-a", "timeout", FailureKind::kTransient); }));
  const auto after = f.Snapshot(id);
  AssertUnchanged(before, after);
  assert(!after.record.next_retry_at_ms);
}

} // namespace

int main() {
  TestTransitionRollsBackOnEventFailure();
  TestTransitionRollsBackOnAuditFailure();
  TestClaimLeavesNoLease();
  TestDeadLetterWriteFailureKeepsItemProcessing();
  TestDeadLetterEventFailureDropsEntry();
  TestRetryEventFailureKeepsBudget();

  std::cout << "workflow_manager_unit_store_failure: pass\n";
  return 0;
}
