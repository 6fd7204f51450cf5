#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace workflow::db::postgres {

using workflow::model::StateFromString;

namespace {

std::string StateText(workflow::model::WorkflowState state) {
  return std::string(workflow::model::ToString(state));
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

// Reads go through here so driver errors surface as StoreUnavailable.
template <typename Fn>
auto Guard(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string(what) + ": " + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::StoreUnavailable(std::string(what) + ": " + e.what());
  }
}

model::WorkflowRecord ReadWorkflow(const pqxx::row& row) {
  model::WorkflowRecord r;
  r.id                       = row[0].c_str();
  r.state                    = StateFromString(row[1].c_str());
  r.version                  = row[2].as<uint64_t>();
  r.stage                    = Text(row[3]);
  r.priority                 = row[4].as<int32_t>();
  r.retry_count              = row[5].as<int32_t>();
  r.max_retries              = row[6].as<int32_t>();
  r.next_retry_at_ms         = OptU64(row[7]);
  r.payload                  = Text(row[8]);
  r.stage_details            = Text(row[9]);
  r.partial_results          = Text(row[10]);
  r.quota_exceeded_count     = row[11].as<int32_t>();
  r.last_quota_check_ms      = OptU64(row[12]);
  r.lease_holder             = OptText(row[13]);
  r.lease_acquired_at_ms     = OptU64(row[14]);
  r.last_error               = OptText(row[15]);
  r.created_at_ms            = row[16].as<uint64_t>();
  r.state_entered_at_ms      = row[17].as<uint64_t>();
  r.queued_at_ms             = OptU64(row[18]);
  r.processing_started_at_ms = OptU64(row[19]);
  r.completed_at_ms          = OptU64(row[20]);
  return r;
}

model::TransitionRecord ReadTransition(const pqxx::row& row) {
  model::TransitionRecord r;
  r.transition_id = row[0].c_str();
  r.workflow_id   = row[1].c_str();
  r.from_state    = StateFromString(row[2].c_str());
  r.to_state      = StateFromString(row[3].c_str());
  r.stage         = Text(row[4]);
  r.reason        = Text(row[5]);
  r.metadata      = Text(row[6]);
  r.actor         = Text(row[7]);
  r.created_at_ms = row[8].as<uint64_t>();
  r.sequence      = row[9].as<uint64_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.event_id      = row[0].c_str();
  r.workflow_id   = row[1].c_str();
  r.event_type    = row[2].c_str();
  r.event_data    = Text(row[3]);
  r.processed     = row[4].as<bool>();
  r.created_at_ms = row[5].as<uint64_t>();
  r.sequence      = row[6].as<uint64_t>();
  return r;
}

model::MetricRecord ReadMetric(const pqxx::row& row) {
  model::MetricRecord r;
  r.metric_id     = row[0].c_str();
  r.workflow_id   = OptText(row[1]);
  r.metric_type   = row[2].c_str();
  r.metric_name   = row[3].c_str();
  r.metric_value  = row[4].as<double>();
  r.metadata      = Text(row[5]);
  r.created_at_ms = row[6].as<uint64_t>();
  return r;
}

model::DeadLetterRecord ReadDeadLetter(const pqxx::row& row) {
  model::DeadLetterRecord r;
  r.deadletter_id      = row[0].c_str();
  r.workflow_id        = row[1].c_str();
  r.original_data      = Text(row[2]);
  r.error_message      = Text(row[3]);
  r.error_details      = Text(row[4]);
  r.failure_count      = row[5].as<int32_t>();
  r.last_failure_at_ms = row[6].as<uint64_t>();
  r.created_at_ms      = row[7].as<uint64_t>();
  r.resolved_at_ms     = OptU64(row[8]);
  r.resolution_notes   = OptText(row[9]);
  return r;
}

model::QuotaUsageRecord ReadQuotaUsage(const pqxx::row& row) {
  model::QuotaUsageRecord r;
  r.log_id        = row[0].c_str();
  r.workflow_id   = OptText(row[1]);
  r.service_name  = row[2].c_str();
  r.usage_data    = Text(row[3]);
  r.created_at_ms = row[4].as<uint64_t>();
  r.sequence      = row[5].as<uint64_t>();
  return r;
}

model::QuotaLimitRecord ReadQuotaLimit(const pqxx::row& row) {
  model::QuotaLimitRecord r;
  r.limit_id       = row[0].c_str();
  r.service_name   = row[1].c_str();
  r.quota_type     = row[2].c_str();
  r.limit_value    = row[3].as<int64_t>();
  r.window_seconds = row[4].as<int64_t>();
  r.is_active      = row[5].as<bool>();
  r.created_at_ms  = row[6].as<uint64_t>();
  r.updated_at_ms  = row[7].as<uint64_t>();
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> Collect(const pqxx::result& res, Reader read) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

template <typename Row, typename Reader>
std::optional<Row> First(const pqxx::result& res, Reader read) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

std::optional<std::string> PartialResults(const model::WorkflowRecord& r) {
  if (r.partial_results.empty()) return std::nullopt;
  return r.partial_results;
}

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::Unavailable, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Workflow items
// ------------------------------------------------------------------

Result PgRepository::InsertWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_workflow", r.id, StateText(r.state), r.version, r.stage, r.priority, r.retry_count, r.max_retries,
                               r.next_retry_at_ms, r.payload, r.stage_details, PartialResults(r), r.quota_exceeded_count, r.last_quota_check_ms,
                               r.lease_holder, r.lease_acquired_at_ms, r.last_error, r.created_at_ms, r.state_entered_at_ms, r.queued_at_ms,
                               r.processing_started_at_ms, r.completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkflowRecord> PgRepository::GetWorkflow(Transaction& t, const std::string& id) {
  return Guard("get workflow", [&] { return First<model::WorkflowRecord>(TX(t).Work().exec_prepared("get_workflow", id), ReadWorkflow); });
}

std::optional<model::WorkflowRecord> PgRepository::LockWorkflow(Transaction& t, const std::string& id) {
  return Guard("lock workflow", [&] { return First<model::WorkflowRecord>(TX(t).Work().exec_prepared("lock_workflow", id), ReadWorkflow); });
}

std::optional<model::WorkflowRecord> PgRepository::LockNextClaimable(Transaction& t, const ClaimCriteria& criteria) {
  return Guard("lock next claimable", [&] {
    return First<model::WorkflowRecord>(TX(t).Work().exec_prepared("lock_next_claimable", criteria.now_ms, criteria.lease_cutoff_ms), ReadWorkflow);
  });
}

Result PgRepository::UpdateWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_workflow", r.id, StateText(r.state), r.version, r.stage, r.priority, r.retry_count, r.max_retries,
                                          r.next_retry_at_ms, r.payload, r.stage_details, PartialResults(r), r.quota_exceeded_count,
                                          r.last_quota_check_ms, r.lease_holder, r.lease_acquired_at_ms, r.last_error, r.created_at_ms,
                                          r.state_entered_at_ms, r.queued_at_ms, r.processing_started_at_ms, r.completed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "workflow " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::WorkflowRecord> PgRepository::ListWorkflows(Transaction& t, const WorkflowFilter& filter) {
  return Guard("list workflows", [&] {
    auto&       work  = TX(t).Work();
    std::string where = "WHERE TRUE";
    if (!filter.states.empty()) {
      where += " AND state IN (";
      for (std::size_t i = 0; i < filter.states.size(); ++i) {
        if (i > 0) where += ",";
        where += work.quote(StateText(filter.states[i]));
      }
      where += ")";
    }
    if (filter.retry_due_at_ms) {
      where += " AND next_retry_at_ms IS NOT NULL AND next_retry_at_ms <= " + std::to_string(*filter.retry_due_at_ms);
    }

    std::string query = Select(sql::kWorkflowColumns, "FROM workflow_items " + where + " ORDER BY created_at_ms ASC, id ASC");
    if (filter.limit > 0) query += " LIMIT " + std::to_string(filter.limit);

    return Collect<model::WorkflowRecord>(work.exec(query), ReadWorkflow);
  });
}

// ------------------------------------------------------------------
// Transitions
// ------------------------------------------------------------------

Result PgRepository::InsertTransition(Transaction& t, model::TransitionRecord& r) {
  try {
    auto res   = TX(t).Work().exec_prepared("insert_transition", r.transition_id, r.workflow_id, StateText(r.from_state), StateText(r.to_state), r.stage,
                                            r.reason, r.metadata, r.actor, r.created_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TransitionRecord> PgRepository::ListTransitions(Transaction& t, const std::string& workflow_id) {
  return Guard("list transitions", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kTransitionColumns, "FROM workflow_transitions WHERE workflow_id=$1 ORDER BY seq ASC"), workflow_id);
    return Collect<model::TransitionRecord>(res, ReadTransition);
  });
}

std::vector<model::TransitionRecord> PgRepository::ListTransitionsSince(Transaction& t, uint64_t since_ms) {
  return Guard("list transitions", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kTransitionColumns, "FROM workflow_transitions WHERE created_at_ms >= $1 ORDER BY seq ASC"), since_ms);
    return Collect<model::TransitionRecord>(res, ReadTransition);
  });
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_event", r.event_id, r.workflow_id, r.event_type, r.event_data, r.processed, r.created_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const std::string& workflow_id) {
  return Guard("list events", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kEventColumns, "FROM workflow_events WHERE workflow_id=$1 ORDER BY seq ASC"), workflow_id);
    return Collect<model::EventRecord>(res, ReadEvent);
  });
}

std::vector<model::EventRecord> PgRepository::ListUnprocessedEvents(Transaction& t, std::size_t limit) {
  return Guard("list unprocessed events", [&] {
    std::string query = Select(sql::kEventColumns, "FROM workflow_events WHERE NOT processed ORDER BY seq ASC");
    if (limit > 0) query += " LIMIT " + std::to_string(limit);
    return Collect<model::EventRecord>(TX(t).Work().exec(query), ReadEvent);
  });
}

Result PgRepository::MarkEventProcessed(Transaction& t, const std::string& event_id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE workflow_events SET processed=TRUE WHERE event_id=$1", event_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "event " + event_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Metrics
// ------------------------------------------------------------------

Result PgRepository::InsertMetric(Transaction& t, const model::MetricRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO workflow_metrics(") + sql::kMetricColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7)", r.metric_id,
                             r.workflow_id, r.metric_type, r.metric_name, r.metric_value, r.metadata, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MetricRecord> PgRepository::ListMetrics(Transaction& t, const std::string& metric_type, uint64_t since_ms) {
  return Guard("list metrics", [&] {
    auto res = TX(t).Work().exec_params(
        Select(sql::kMetricColumns, "FROM workflow_metrics WHERE created_at_ms >= $1 AND ($2 = '' OR metric_type = $2) ORDER BY created_at_ms ASC"),
        since_ms, metric_type);
    return Collect<model::MetricRecord>(res, ReadMetric);
  });
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result PgRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO dead_letter_queue(") + sql::kDeadLetterColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)",
                             r.deadletter_id, r.workflow_id, r.original_data, r.error_message, r.error_details, r.failure_count,
                             r.last_failure_at_ms, r.created_at_ms, r.resolved_at_ms, r.resolution_notes);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE dead_letter_queue SET original_data=$2,error_message=$3,error_details=$4,failure_count=$5,"
        "last_failure_at_ms=$6,resolved_at_ms=$7,resolution_notes=$8 WHERE deadletter_id=$1",
        r.deadletter_id, r.original_data, r.error_message, r.error_details, r.failure_count, r.last_failure_at_ms, r.resolved_at_ms,
        r.resolution_notes);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "dead letter " + r.deadletter_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeadLetterRecord> PgRepository::GetDeadLetter(Transaction& t, const std::string& deadletter_id) {
  return Guard("get dead letter", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kDeadLetterColumns, "FROM dead_letter_queue WHERE deadletter_id=$1"), deadletter_id);
    return First<model::DeadLetterRecord>(res, ReadDeadLetter);
  });
}

std::optional<model::DeadLetterRecord> PgRepository::GetDeadLetterByWorkflow(Transaction& t, const std::string& workflow_id) {
  return Guard("get dead letter", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kDeadLetterColumns, "FROM dead_letter_queue WHERE workflow_id=$1"), workflow_id);
    return First<model::DeadLetterRecord>(res, ReadDeadLetter);
  });
}

std::vector<model::DeadLetterRecord> PgRepository::ListDeadLetters(Transaction& t) {
  return Guard("list dead letters", [&] {
    auto res = TX(t).Work().exec(Select(sql::kDeadLetterColumns, "FROM dead_letter_queue ORDER BY last_failure_at_ms DESC, deadletter_id ASC"));
    return Collect<model::DeadLetterRecord>(res, ReadDeadLetter);
  });
}

// ------------------------------------------------------------------
// Quota
// ------------------------------------------------------------------

Result PgRepository::InsertQuotaUsage(Transaction& t, model::QuotaUsageRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO quota_usage_log(log_id,workflow_id,service_name,usage_data,created_at_ms) VALUES($1,$2,$3,$4,$5) RETURNING seq", r.log_id,
        r.workflow_id, r.service_name, r.usage_data, r.created_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::QuotaUsageRecord> PgRepository::LatestQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  return Guard("latest quota usage", [&] {
    auto res = TX(t).Work().exec_params(
        Select(sql::kQuotaUsageColumns, "FROM quota_usage_log WHERE service_name=$1 AND created_at_ms >= $2 ORDER BY created_at_ms DESC, seq DESC LIMIT 1"),
        service_name, since_ms);
    return First<model::QuotaUsageRecord>(res, ReadQuotaUsage);
  });
}

std::vector<model::QuotaUsageRecord> PgRepository::ListQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  return Guard("list quota usage", [&] {
    auto res = TX(t).Work().exec_params(
        Select(sql::kQuotaUsageColumns, "FROM quota_usage_log WHERE service_name=$1 AND created_at_ms >= $2 ORDER BY created_at_ms ASC, seq ASC"),
        service_name, since_ms);
    return Collect<model::QuotaUsageRecord>(res, ReadQuotaUsage);
  });
}

Result PgRepository::UpsertQuotaLimit(Transaction& t, const model::QuotaLimitRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO quota_limits(") + sql::kQuotaLimitColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(service_name, quota_type) DO UPDATE SET"
                                 " limit_value=EXCLUDED.limit_value, window_seconds=EXCLUDED.window_seconds,"
                                 " is_active=EXCLUDED.is_active, updated_at_ms=EXCLUDED.updated_at_ms",
                             r.limit_id, r.service_name, r.quota_type, r.limit_value, r.window_seconds, r.is_active, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::QuotaLimitRecord> PgRepository::GetQuotaLimit(Transaction& t, const std::string& service_name, const std::string& quota_type) {
  return Guard("get quota limit", [&] {
    auto res = TX(t).Work().exec_params(Select(sql::kQuotaLimitColumns, "FROM quota_limits WHERE service_name=$1 AND quota_type=$2"), service_name,
                                        quota_type);
    return First<model::QuotaLimitRecord>(res, ReadQuotaLimit);
  });
}

std::vector<model::QuotaLimitRecord> PgRepository::ListQuotaLimits(Transaction& t, const std::string& service_name) {
  return Guard("list quota limits", [&] {
    auto res = TX(t).Work().exec_params(
        Select(sql::kQuotaLimitColumns, "FROM quota_limits WHERE ($1 = '' OR service_name = $1) ORDER BY service_name ASC, quota_type ASC"), service_name);
    return Collect<model::QuotaLimitRecord>(res, ReadQuotaLimit);
  });
}

} // namespace workflow::db::postgres
