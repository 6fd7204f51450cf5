#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/deadletter_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/metric_record.hpp"
#include "internal/db/model/quota_records.hpp"
#include "internal/db/model/transition_record.hpp"
#include "internal/db/model/workflow_record.hpp"

namespace workflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - LockWorkflow / LockNextClaimable hold an exclusive row lock until
    the transaction ends; two transactions never hold the same row
  - Audit tables (transitions, events, metrics, quota usage) are
    append-only; events only ever flip `processed`

  The store is the single source of truth: there is no in-process
  state shared between workers.

  Writes return Result; reads throw util::StoreUnavailable when the
  backend fails.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Workflow items
  // ---------------------------------------------------------------------

  virtual Result InsertWorkflow(Transaction&, const model::WorkflowRecord&) = 0;

  virtual std::optional<model::WorkflowRecord> GetWorkflow(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::WorkflowRecord> LockWorkflow(Transaction&, const std::string& id) = 0;

  // Rows locked by other transactions are skipped, never waited on.
  virtual std::optional<model::WorkflowRecord> LockNextClaimable(Transaction&, const ClaimCriteria& criteria) = 0;

  virtual Result UpdateWorkflow(Transaction&, const model::WorkflowRecord&) = 0;

  virtual std::vector<model::WorkflowRecord> ListWorkflows(Transaction&, const WorkflowFilter& filter) = 0;

  // ---------------------------------------------------------------------
  // Transition audit
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result InsertTransition(Transaction&, model::TransitionRecord& record) = 0;

  // Ordered by sequence.
  virtual std::vector<model::TransitionRecord> ListTransitions(Transaction&, const std::string& workflow_id) = 0;

  virtual std::vector<model::TransitionRecord> ListTransitionsSince(Transaction&, uint64_t since_ms) = 0;

  // ---------------------------------------------------------------------
  // Domain events
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& workflow_id) = 0;

  // Oldest first; limit 0 = unlimited.
  virtual std::vector<model::EventRecord> ListUnprocessedEvents(Transaction&, std::size_t limit) = 0;

  virtual Result MarkEventProcessed(Transaction&, const std::string& event_id) = 0;

  // ---------------------------------------------------------------------
  // Metric samples
  // ---------------------------------------------------------------------

  virtual Result InsertMetric(Transaction&, const model::MetricRecord&) = 0;

  // Empty metric_type matches every type.
  virtual std::vector<model::MetricRecord> ListMetrics(Transaction&, const std::string& metric_type, uint64_t since_ms) = 0;

  // ---------------------------------------------------------------------
  // Dead letters
  // ---------------------------------------------------------------------

  virtual Result InsertDeadLetter(Transaction&, const model::DeadLetterRecord&) = 0;

  virtual Result UpdateDeadLetter(Transaction&, const model::DeadLetterRecord&) = 0;

  virtual std::optional<model::DeadLetterRecord> GetDeadLetter(Transaction&, const std::string& deadletter_id) = 0;

  virtual std::optional<model::DeadLetterRecord> GetDeadLetterByWorkflow(Transaction&, const std::string& workflow_id) = 0;

  // Newest failure first.
  virtual std::vector<model::DeadLetterRecord> ListDeadLetters(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Quota
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result InsertQuotaUsage(Transaction&, model::QuotaUsageRecord& record) = 0;

  // Newest snapshot with created_at_ms >= since_ms.
  virtual std::optional<model::QuotaUsageRecord> LatestQuotaUsage(Transaction&, const std::string& service_name, uint64_t since_ms) = 0;

  // Oldest first.
  virtual std::vector<model::QuotaUsageRecord> ListQuotaUsage(Transaction&, const std::string& service_name, uint64_t since_ms) = 0;

  // Inserts, or on (service_name, quota_type) updates limit/window/active/updated_at.
  virtual Result UpsertQuotaLimit(Transaction&, const model::QuotaLimitRecord&) = 0;

  virtual std::optional<model::QuotaLimitRecord> GetQuotaLimit(Transaction&, const std::string& service_name, const std::string& quota_type) = 0;

  // Empty service_name lists every service.
  virtual std::vector<model::QuotaLimitRecord> ListQuotaLimits(Transaction&, const std::string& service_name) = 0;
};

} // namespace workflow::db
