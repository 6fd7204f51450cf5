#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace workflow::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertWorkflow(Transaction&, const model::WorkflowRecord&) override;
  std::optional<model::WorkflowRecord> GetWorkflow(Transaction&, const std::string&) override;
  std::optional<model::WorkflowRecord> LockWorkflow(Transaction&, const std::string&) override;
  std::optional<model::WorkflowRecord> LockNextClaimable(Transaction&, const ClaimCriteria&) override;
  Result                               UpdateWorkflow(Transaction&, const model::WorkflowRecord&) override;
  std::vector<model::WorkflowRecord>   ListWorkflows(Transaction&, const WorkflowFilter&) override;

  Result                               InsertTransition(Transaction&, model::TransitionRecord&) override;
  std::vector<model::TransitionRecord> ListTransitions(Transaction&, const std::string&) override;
  std::vector<model::TransitionRecord> ListTransitionsSince(Transaction&, uint64_t) override;

  Result                          InsertEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::string&) override;
  std::vector<model::EventRecord> ListUnprocessedEvents(Transaction&, std::size_t) override;
  Result                          MarkEventProcessed(Transaction&, const std::string&) override;

  Result                           InsertMetric(Transaction&, const model::MetricRecord&) override;
  std::vector<model::MetricRecord> ListMetrics(Transaction&, const std::string&, uint64_t) override;

  Result                                 InsertDeadLetter(Transaction&, const model::DeadLetterRecord&) override;
  Result                                 UpdateDeadLetter(Transaction&, const model::DeadLetterRecord&) override;
  std::optional<model::DeadLetterRecord> GetDeadLetter(Transaction&, const std::string&) override;
  std::optional<model::DeadLetterRecord> GetDeadLetterByWorkflow(Transaction&, const std::string&) override;
  std::vector<model::DeadLetterRecord>   ListDeadLetters(Transaction&) override;

  Result                                 InsertQuotaUsage(Transaction&, model::QuotaUsageRecord&) override;
  std::optional<model::QuotaUsageRecord> LatestQuotaUsage(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::QuotaUsageRecord>   ListQuotaUsage(Transaction&, const std::string&, uint64_t) override;
  Result                                 UpsertQuotaLimit(Transaction&, const model::QuotaLimitRecord&) override;
  std::optional<model::QuotaLimitRecord> GetQuotaLimit(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::QuotaLimitRecord>   ListQuotaLimits(Transaction&, const std::string&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace workflow::db::postgres
