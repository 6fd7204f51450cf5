#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace workflow::db::sqlite {

using workflow::db::ErrorCode;
using workflow::db::Result;
using workflow::model::StateFromString;

namespace {

class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
  throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
}

void RequirePrepared(sqlite3* db, const Statement& st) {
  if (!st.Prepared()) ThrowRead(db, "sqlite prepare");
}

template <typename Row, typename Reader>
std::vector<Row> Collect(sqlite3* db, Statement& st, Reader read) {
  std::vector<Row> out;
  for (;;) {
    const int rc = st.Step();
    if (rc == SQLITE_ROW) {
      out.push_back(read(st.get()));
      continue;
    }
    if (rc == SQLITE_DONE) break;
    ThrowRead(db, "sqlite step");
  }
  return out;
}

template <typename Row, typename Reader>
std::optional<Row> First(sqlite3* db, Statement& st, Reader read) {
  const int rc = st.Step();
  if (rc == SQLITE_ROW) return read(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  ThrowRead(db, "sqlite step");
}

// Binds all kWorkflowColumns in order, starting at ?1.
void BindWorkflow(sqlite3_stmt* st, const model::WorkflowRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, std::string(workflow::model::ToString(r.state)));
  BindU64(st, 3, r.version);
  BindText(st, 4, r.stage);
  BindI32(st, 5, r.priority);
  BindI32(st, 6, r.retry_count);
  BindI32(st, 7, r.max_retries);
  BindOptU64(st, 8, r.next_retry_at_ms);
  BindText(st, 9, r.payload);
  BindText(st, 10, r.stage_details);
  BindOptText(st, 11, r.partial_results.empty() ? std::nullopt : std::optional<std::string>(r.partial_results));
  BindI32(st, 12, r.quota_exceeded_count);
  BindOptU64(st, 13, r.last_quota_check_ms);
  BindOptText(st, 14, r.lease_holder);
  BindOptU64(st, 15, r.lease_acquired_at_ms);
  BindOptText(st, 16, r.last_error);
  BindU64(st, 17, r.created_at_ms);
  BindU64(st, 18, r.state_entered_at_ms);
  BindOptU64(st, 19, r.queued_at_ms);
  BindOptU64(st, 20, r.processing_started_at_ms);
  BindOptU64(st, 21, r.completed_at_ms);
}

model::WorkflowRecord ReadWorkflow(sqlite3_stmt* st) {
  model::WorkflowRecord r;
  r.id                       = ColText(st, 0);
  r.state                    = StateFromString(ColText(st, 1));
  r.version                  = ColU64(st, 2);
  r.stage                    = ColText(st, 3);
  r.priority                 = ColI32(st, 4);
  r.retry_count              = ColI32(st, 5);
  r.max_retries              = ColI32(st, 6);
  r.next_retry_at_ms         = ColOptU64(st, 7);
  r.payload                  = ColText(st, 8);
  r.stage_details            = ColText(st, 9);
  r.partial_results          = ColText(st, 10);
  r.quota_exceeded_count     = ColI32(st, 11);
  r.last_quota_check_ms      = ColOptU64(st, 12);
  r.lease_holder             = ColOptText(st, 13);
  r.lease_acquired_at_ms     = ColOptU64(st, 14);
  r.last_error               = ColOptText(st, 15);
  r.created_at_ms            = ColU64(st, 16);
  r.state_entered_at_ms      = ColU64(st, 17);
  r.queued_at_ms             = ColOptU64(st, 18);
  r.processing_started_at_ms = ColOptU64(st, 19);
  r.completed_at_ms          = ColOptU64(st, 20);
  return r;
}

model::TransitionRecord ReadTransition(sqlite3_stmt* st) {
  model::TransitionRecord r;
  r.transition_id = ColText(st, 0);
  r.workflow_id   = ColText(st, 1);
  r.from_state    = StateFromString(ColText(st, 2));
  r.to_state      = StateFromString(ColText(st, 3));
  r.stage         = ColText(st, 4);
  r.reason        = ColText(st, 5);
  r.metadata      = ColText(st, 6);
  r.actor         = ColText(st, 7);
  r.created_at_ms = ColU64(st, 8);
  r.sequence      = ColU64(st, 9);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.event_id      = ColText(st, 0);
  r.workflow_id   = ColText(st, 1);
  r.event_type    = ColText(st, 2);
  r.event_data    = ColText(st, 3);
  r.processed     = ColI32(st, 4) != 0;
  r.created_at_ms = ColU64(st, 5);
  r.sequence      = ColU64(st, 6);
  return r;
}

model::MetricRecord ReadMetric(sqlite3_stmt* st) {
  model::MetricRecord r;
  r.metric_id     = ColText(st, 0);
  r.workflow_id   = ColOptText(st, 1);
  r.metric_type   = ColText(st, 2);
  r.metric_name   = ColText(st, 3);
  r.metric_value  = sqlite3_column_double(st, 4);
  r.metadata      = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::DeadLetterRecord ReadDeadLetter(sqlite3_stmt* st) {
  model::DeadLetterRecord r;
  r.deadletter_id      = ColText(st, 0);
  r.workflow_id        = ColText(st, 1);
  r.original_data      = ColText(st, 2);
  r.error_message      = ColText(st, 3);
  r.error_details      = ColText(st, 4);
  r.failure_count      = ColI32(st, 5);
  r.last_failure_at_ms = ColU64(st, 6);
  r.created_at_ms      = ColU64(st, 7);
  r.resolved_at_ms     = ColOptU64(st, 8);
  r.resolution_notes   = ColOptText(st, 9);
  return r;
}

model::QuotaUsageRecord ReadQuotaUsage(sqlite3_stmt* st) {
  model::QuotaUsageRecord r;
  r.log_id        = ColText(st, 0);
  r.workflow_id   = ColOptText(st, 1);
  r.service_name  = ColText(st, 2);
  r.usage_data    = ColText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.sequence      = ColU64(st, 5);
  return r;
}

model::QuotaLimitRecord ReadQuotaLimit(sqlite3_stmt* st) {
  model::QuotaLimitRecord r;
  r.limit_id       = ColText(st, 0);
  r.service_name   = ColText(st, 1);
  r.quota_type     = ColText(st, 2);
  r.limit_value    = ColI64(st, 3);
  r.window_seconds = ColI64(st, 4);
  r.is_active      = ColI32(st, 5) != 0;
  r.created_at_ms  = ColU64(st, 6);
  r.updated_at_ms  = ColU64(st, 7);
  return r;
}

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Workflow items
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO workflow_items(") + sql::kWorkflowColumns +
                       ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20,?21);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindWorkflow(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::WorkflowRecord> SqliteRepository::GetWorkflow(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kWorkflowColumns, "FROM workflow_items WHERE id=?;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, id);
  return First<model::WorkflowRecord>(db, st, ReadWorkflow);
}

std::optional<model::WorkflowRecord> SqliteRepository::LockWorkflow(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetWorkflow(t, id);
}

std::optional<model::WorkflowRecord> SqliteRepository::LockNextClaimable(Transaction& t, const ClaimCriteria& criteria) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kWorkflowColumns,
                          "FROM workflow_items WHERE state='queued'"
                          " AND (next_retry_at_ms IS NULL OR next_retry_at_ms <= ?1)"
                          " AND (lease_holder IS NULL OR lease_acquired_at_ms IS NULL OR lease_acquired_at_ms < ?2)"
                          " ORDER BY priority DESC, queued_at_ms IS NULL, queued_at_ms ASC, created_at_ms ASC, id ASC LIMIT 1;"));
  RequirePrepared(db, st);
  BindU64(st.get(), 1, criteria.now_ms);
  BindU64(st.get(), 2, criteria.lease_cutoff_ms);
  return First<model::WorkflowRecord>(db, st, ReadWorkflow);
}

Result SqliteRepository::UpdateWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE workflow_items SET state=?2,version=?3,stage=?4,priority=?5,retry_count=?6,max_retries=?7,"
               "next_retry_at_ms=?8,payload=?9,stage_details=?10,partial_results=?11,quota_exceeded_count=?12,"
               "last_quota_check_ms=?13,lease_holder=?14,lease_acquired_at_ms=?15,last_error=?16,created_at_ms=?17,"
               "state_entered_at_ms=?18,queued_at_ms=?19,processing_started_at_ms=?20,completed_at_ms=?21 WHERE id=?1;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindWorkflow(st.get(), r);
  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "workflow " + r.id);
  return result;
}

std::vector<model::WorkflowRecord> SqliteRepository::ListWorkflows(Transaction& t, const WorkflowFilter& filter) {
  auto* db = TX(t).Handle();

  std::string where = "WHERE 1=1";
  if (!filter.states.empty()) {
    where += " AND state IN (";
    for (std::size_t i = 0; i < filter.states.size(); ++i) {
      where += i == 0 ? "?" : ",?";
    }
    where += ")";
  }
  if (filter.retry_due_at_ms) where += " AND next_retry_at_ms IS NOT NULL AND next_retry_at_ms <= ?";

  std::string query = Select(sql::kWorkflowColumns, "FROM workflow_items " + where + " ORDER BY created_at_ms ASC, id ASC");
  if (filter.limit > 0) query += " LIMIT " + std::to_string(filter.limit);
  query += ";";

  Statement st(db, query);
  RequirePrepared(db, st);

  int idx = 1;
  for (auto state : filter.states) {
    BindText(st.get(), idx++, std::string(workflow::model::ToString(state)));
  }
  if (filter.retry_due_at_ms) BindU64(st.get(), idx++, *filter.retry_due_at_ms);

  return Collect<model::WorkflowRecord>(db, st, ReadWorkflow);
}

// ------------------------------------------------------------------
// Transitions
// ------------------------------------------------------------------

Result SqliteRepository::InsertTransition(Transaction& t, model::TransitionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO workflow_transitions(transition_id,workflow_id,from_state,to_state,stage,reason,metadata,actor,created_at_ms)"
               " VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.transition_id);
  BindText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, std::string(workflow::model::ToString(r.from_state)));
  BindText(st.get(), 4, std::string(workflow::model::ToString(r.to_state)));
  BindText(st.get(), 5, r.stage);
  BindText(st.get(), 6, r.reason);
  BindText(st.get(), 7, r.metadata);
  BindText(st.get(), 8, r.actor);
  BindU64(st.get(), 9, r.created_at_ms);

  auto result = Translate(db, st.Step());
  if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::TransitionRecord> SqliteRepository::ListTransitions(Transaction& t, const std::string& workflow_id) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kTransitionColumns, "FROM workflow_transitions WHERE workflow_id=? ORDER BY seq ASC;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, workflow_id);
  return Collect<model::TransitionRecord>(db, st, ReadTransition);
}

std::vector<model::TransitionRecord> SqliteRepository::ListTransitionsSince(Transaction& t, uint64_t since_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kTransitionColumns, "FROM workflow_transitions WHERE created_at_ms >= ? ORDER BY seq ASC;"));
  RequirePrepared(db, st);
  BindU64(st.get(), 1, since_ms);
  return Collect<model::TransitionRecord>(db, st, ReadTransition);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO workflow_events(event_id,workflow_id,event_type,event_data,processed,created_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.event_id);
  BindText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, r.event_type);
  BindText(st.get(), 4, r.event_data);
  BindI32(st.get(), 5, r.processed ? 1 : 0);
  BindU64(st.get(), 6, r.created_at_ms);

  auto result = Translate(db, st.Step());
  if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const std::string& workflow_id) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kEventColumns, "FROM workflow_events WHERE workflow_id=? ORDER BY seq ASC;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, workflow_id);
  return Collect<model::EventRecord>(db, st, ReadEvent);
}

std::vector<model::EventRecord> SqliteRepository::ListUnprocessedEvents(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();

  std::string query = Select(sql::kEventColumns, "FROM workflow_events WHERE processed=0 ORDER BY seq ASC");
  if (limit > 0) query += " LIMIT " + std::to_string(limit);
  query += ";";

  Statement st(db, query);
  RequirePrepared(db, st);
  return Collect<model::EventRecord>(db, st, ReadEvent);
}

Result SqliteRepository::MarkEventProcessed(Transaction& t, const std::string& event_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE workflow_events SET processed=1 WHERE event_id=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, event_id);
  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "event " + event_id);
  return result;
}

// ------------------------------------------------------------------
// Metrics
// ------------------------------------------------------------------

Result SqliteRepository::InsertMetric(Transaction& t, const model::MetricRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO workflow_metrics(") + sql::kMetricColumns + ") VALUES(?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.metric_id);
  BindOptText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, r.metric_type);
  BindText(st.get(), 4, r.metric_name);
  sqlite3_bind_double(st.get(), 5, r.metric_value);
  BindText(st.get(), 6, r.metadata);
  BindU64(st.get(), 7, r.created_at_ms);

  return Translate(db, st.Step());
}

std::vector<model::MetricRecord> SqliteRepository::ListMetrics(Transaction& t, const std::string& metric_type, uint64_t since_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kMetricColumns, "FROM workflow_metrics WHERE created_at_ms >= ?1 AND (?2 = '' OR metric_type = ?2) ORDER BY created_at_ms ASC;"));
  RequirePrepared(db, st);
  BindU64(st.get(), 1, since_ms);
  BindText(st.get(), 2, metric_type);
  return Collect<model::MetricRecord>(db, st, ReadMetric);
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO dead_letter_queue(") + sql::kDeadLetterColumns + ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.deadletter_id);
  BindText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, r.original_data);
  BindText(st.get(), 4, r.error_message);
  BindText(st.get(), 5, r.error_details);
  BindI32(st.get(), 6, r.failure_count);
  BindU64(st.get(), 7, r.last_failure_at_ms);
  BindU64(st.get(), 8, r.created_at_ms);
  BindOptU64(st.get(), 9, r.resolved_at_ms);
  BindOptText(st.get(), 10, r.resolution_notes);

  return Translate(db, st.Step());
}

Result SqliteRepository::UpdateDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE dead_letter_queue SET original_data=?2,error_message=?3,error_details=?4,failure_count=?5,"
               "last_failure_at_ms=?6,resolved_at_ms=?7,resolution_notes=?8 WHERE deadletter_id=?1;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.deadletter_id);
  BindText(st.get(), 2, r.original_data);
  BindText(st.get(), 3, r.error_message);
  BindText(st.get(), 4, r.error_details);
  BindI32(st.get(), 5, r.failure_count);
  BindU64(st.get(), 6, r.last_failure_at_ms);
  BindOptU64(st.get(), 7, r.resolved_at_ms);
  BindOptText(st.get(), 8, r.resolution_notes);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "dead letter " + r.deadletter_id);
  return result;
}

std::optional<model::DeadLetterRecord> SqliteRepository::GetDeadLetter(Transaction& t, const std::string& deadletter_id) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kDeadLetterColumns, "FROM dead_letter_queue WHERE deadletter_id=?;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, deadletter_id);
  return First<model::DeadLetterRecord>(db, st, ReadDeadLetter);
}

std::optional<model::DeadLetterRecord> SqliteRepository::GetDeadLetterByWorkflow(Transaction& t, const std::string& workflow_id) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kDeadLetterColumns, "FROM dead_letter_queue WHERE workflow_id=?;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, workflow_id);
  return First<model::DeadLetterRecord>(db, st, ReadDeadLetter);
}

std::vector<model::DeadLetterRecord> SqliteRepository::ListDeadLetters(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kDeadLetterColumns, "FROM dead_letter_queue ORDER BY last_failure_at_ms DESC, deadletter_id ASC;"));
  RequirePrepared(db, st);
  return Collect<model::DeadLetterRecord>(db, st, ReadDeadLetter);
}

// ------------------------------------------------------------------
// Quota
// ------------------------------------------------------------------

Result SqliteRepository::InsertQuotaUsage(Transaction& t, model::QuotaUsageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO quota_usage_log(log_id,workflow_id,service_name,usage_data,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.log_id);
  BindOptText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, r.service_name);
  BindText(st.get(), 4, r.usage_data);
  BindU64(st.get(), 5, r.created_at_ms);

  auto result = Translate(db, st.Step());
  if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::QuotaUsageRecord> SqliteRepository::LatestQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kQuotaUsageColumns, "FROM quota_usage_log WHERE service_name=? AND created_at_ms >= ? ORDER BY created_at_ms DESC, seq DESC LIMIT 1;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, service_name);
  BindU64(st.get(), 2, since_ms);
  return First<model::QuotaUsageRecord>(db, st, ReadQuotaUsage);
}

std::vector<model::QuotaUsageRecord> SqliteRepository::ListQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kQuotaUsageColumns, "FROM quota_usage_log WHERE service_name=? AND created_at_ms >= ? ORDER BY created_at_ms ASC, seq ASC;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, service_name);
  BindU64(st.get(), 2, since_ms);
  return Collect<model::QuotaUsageRecord>(db, st, ReadQuotaUsage);
}

Result SqliteRepository::UpsertQuotaLimit(Transaction& t, const model::QuotaLimitRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO quota_limits(") + sql::kQuotaLimitColumns +
                       ") VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(service_name, quota_type) DO UPDATE SET"
                       " limit_value=excluded.limit_value, window_seconds=excluded.window_seconds,"
                       " is_active=excluded.is_active, updated_at_ms=excluded.updated_at_ms;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.limit_id);
  BindText(st.get(), 2, r.service_name);
  BindText(st.get(), 3, r.quota_type);
  BindI64(st.get(), 4, r.limit_value);
  BindI64(st.get(), 5, r.window_seconds);
  BindI32(st.get(), 6, r.is_active ? 1 : 0);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);

  return Translate(db, st.Step());
}

std::optional<model::QuotaLimitRecord> SqliteRepository::GetQuotaLimit(Transaction& t, const std::string& service_name, const std::string& quota_type) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kQuotaLimitColumns, "FROM quota_limits WHERE service_name=? AND quota_type=?;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, service_name);
  BindText(st.get(), 2, quota_type);
  return First<model::QuotaLimitRecord>(db, st, ReadQuotaLimit);
}

std::vector<model::QuotaLimitRecord> SqliteRepository::ListQuotaLimits(Transaction& t, const std::string& service_name) {
  auto* db = TX(t).Handle();

  Statement st(db, Select(sql::kQuotaLimitColumns, "FROM quota_limits WHERE (?1 = '' OR service_name = ?1) ORDER BY service_name ASC, quota_type ASC;"));
  RequirePrepared(db, st);
  BindText(st.get(), 1, service_name);
  return Collect<model::QuotaLimitRecord>(db, st, ReadQuotaLimit);
}

} // namespace workflow::db::sqlite
