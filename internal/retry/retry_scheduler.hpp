#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/core/transition_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/deadletter/deadletter_store.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/quota/quota_tracker.hpp"
#include "internal/util/time.hpp"

namespace workflow::retry {

enum class FailureKind {
  kTransient,
  kPermanent,
};

enum class FailureOutcome {
  // The item was no longer processing; nothing changed.
  kNotProcessing,
  kRetryScheduled,
  kDeadLettered,
};

std::string_view ToString(FailureKind kind);
std::string_view ToString(FailureOutcome outcome);

/*
  RetryScheduler

  Decides what happens to an item after its worker reports back. Every
  decision commits as one unit together with the transition, the
  lease release and the audit rows.

  Transient failures back off exponentially from the pre-failure retry
  count n: next_retry_at = now + base_delay * 2^n while n < max_retries,
  otherwise the item fails into the dead-letter queue. Permanent
  failures dead-letter at once without consuming retries.
*/
class RetryScheduler {
 public:
  struct Options {
    std::chrono::seconds base_delay{std::chrono::minutes(5)};
  };

  RetryScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::TransitionEngine> engine,
                 std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<quota::QuotaTracker> quota,
                 std::shared_ptr<deadletter::DeadLetterStore> deadletters, std::shared_ptr<events::EventEmitter> emitter,
                 std::shared_ptr<const util::Clock> clock, Options options);

  FailureOutcome OnFailure(const std::string& workflow_id, const std::string& worker_id, const std::string& error, FailureKind kind);

  // processing -> quota_exceeded, parked until the estimated reset.
  bool OnQuotaExceeded(const std::string& workflow_id, const std::string& worker_id, const std::string& service_name,
                       const std::optional<std::string>& partial_results = std::nullopt);

  // quota_exceeded -> quota_exceeded with a fresh reset estimate.
  bool RefreshQuotaStatus(const std::string& workflow_id, const std::string& service_name);

  // processing -> partially_processed; resumable after `resume_after`.
  bool OnPartialProgress(const std::string& workflow_id, const std::string& worker_id, const std::string& partial_results,
                         const std::string& stage, std::chrono::seconds resume_after = std::chrono::seconds(0));

  // Parked items whose next_retry_at has passed go back to queued.
  std::size_t ResumeEligible(std::size_t limit = 0);

  std::chrono::seconds BackoffDelay(int retry_count) const;

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<core::TransitionEngine>      engine_;
  std::shared_ptr<lease::LeaseManager>         leases_;
  std::shared_ptr<quota::QuotaTracker>         quota_;
  std::shared_ptr<deadletter::DeadLetterStore> deadletters_;
  std::shared_ptr<events::EventEmitter>        emitter_;
  std::shared_ptr<const util::Clock>           clock_;
  Options                                      options_;
};

} // namespace workflow::retry
