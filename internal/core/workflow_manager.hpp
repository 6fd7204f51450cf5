#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/transition_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/deadletter/deadletter_store.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/quota/quota_tracker.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/util/time.hpp"

namespace workflow::core {

/*
  WorkflowManager

  Entry points for producers, workers and operators. Each call is one
  transaction; the components underneath only ever work inside it.

  Worker calls check the lease: a different live holder raises
  util::LeaseConflict, an unleased item is accepted. Losing a race
  (the item already moved on) is a false / empty result.
*/
class WorkflowManager {
 public:
  struct Options {
    int                  default_max_retries = 3;
    std::chrono::seconds lease_timeout{std::chrono::minutes(5)};
  };

  WorkflowManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<TransitionEngine> engine,
                  std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<quota::QuotaTracker> quota,
                  std::shared_ptr<retry::RetryScheduler> scheduler, std::shared_ptr<deadletter::DeadLetterStore> deadletters,
                  std::shared_ptr<events::EventEmitter> emitter, std::shared_ptr<const util::Clock> clock, Options options);

  // ------------------------------------------------------------------
  // Producer
  // ------------------------------------------------------------------

  std::string Enqueue(const std::string& payload, int priority = 0, std::optional<int> max_retries = std::nullopt);
  std::string EnqueueAndQueue(const std::string& payload, int priority = 0, std::optional<int> max_retries = std::nullopt);

  // ------------------------------------------------------------------
  // Worker
  // ------------------------------------------------------------------

  std::optional<db::model::WorkflowRecord> ClaimNext(const std::string& worker_id, std::optional<std::chrono::seconds> lease_timeout = std::nullopt);

  // processing -> processing; also refreshes the worker's lease.
  bool AdvanceStage(const std::string& workflow_id, const std::string& worker_id, const std::string& stage, const model::Attributes& details = {});

  bool Complete(const std::string& workflow_id, const std::string& worker_id, const model::Attributes& details = {});

  retry::FailureOutcome Fail(const std::string& workflow_id, const std::string& worker_id, const std::string& error, retry::FailureKind kind);

  bool ReportQuotaExceeded(const std::string& workflow_id, const std::string& worker_id, const std::string& service_name,
                           const std::optional<std::string>& partial_results = std::nullopt);

  bool ReportPartialProgress(const std::string& workflow_id, const std::string& worker_id, const std::string& partial_results,
                             const std::string& stage, std::chrono::seconds resume_after = std::chrono::seconds(0));

  // Takes over one processing item whose lease went stale. State,
  // stage and partial results are left as they were.
  std::optional<db::model::WorkflowRecord> ReclaimStale(const std::string& worker_id, std::optional<std::chrono::seconds> lease_timeout = std::nullopt);

  // ------------------------------------------------------------------
  // Operator
  // ------------------------------------------------------------------

  // failed -> queued with a fresh retry budget.
  bool Retry(const std::string& workflow_id, const std::string& actor = "operator");
  bool Cancel(const std::string& workflow_id, const std::string& reason, const std::string& actor = "operator");
  bool Suspend(const std::string& workflow_id, const std::string& reason, const std::string& actor = "operator");
  bool Resume(const std::string& workflow_id, const std::string& actor = "operator");
  // quota_exceeded -> queued without waiting for the reset estimate.
  bool ResumeQuotaExceeded(const std::string& workflow_id, const std::string& actor = "operator");

  std::size_t ResumeEligible(std::size_t limit = 0);

  // ------------------------------------------------------------------
  // Read side
  // ------------------------------------------------------------------

  std::optional<db::model::WorkflowRecord> Get(const std::string& workflow_id);
  std::vector<db::model::TransitionRecord> History(const std::string& workflow_id);
  std::vector<db::model::EventRecord>      Events(const std::string& workflow_id);
  std::vector<db::model::EventRecord>      UnprocessedEvents(std::size_t limit = 0);
  void                                     MarkEventProcessed(const std::string& event_id);
  // quota_exceeded and partially_processed items, priority desc then queued_at.
  std::vector<db::model::WorkflowRecord>   QuotaExceededBacklog(std::size_t limit = 0);
  std::vector<db::model::DeadLetterRecord> DeadLetters(bool unresolved_only = true);

 private:
  using StateSet = std::vector<model::WorkflowState>;

  std::string Insert(const std::string& payload, int priority, std::optional<int> max_retries, bool queue);

  // Moves the item from whatever allowed state it is in to `to`.
  bool OperatorTransition(const std::string& workflow_id, const StateSet& allowed_from, model::WorkflowState to, const std::string& reason,
                          const std::string& actor, const TransitionEngine::RecordMutator& mutator);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<TransitionEngine>            engine_;
  std::shared_ptr<lease::LeaseManager>         leases_;
  std::shared_ptr<quota::QuotaTracker>         quota_;
  std::shared_ptr<retry::RetryScheduler>       scheduler_;
  std::shared_ptr<deadletter::DeadLetterStore> deadletters_;
  std::shared_ptr<events::EventEmitter>        emitter_;
  std::shared_ptr<const util::Clock>           clock_;
  Options                                      options_;
};

} // namespace workflow::core
