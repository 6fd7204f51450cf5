#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace workflow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Wrap(conn.release());
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = sql::kWorkflowColumns;

  conn.prepare("get_workflow", "SELECT " + columns + " FROM workflow_items WHERE id=$1");
  conn.prepare("lock_workflow", "SELECT " + columns + " FROM workflow_items WHERE id=$1 FOR UPDATE");
  conn.prepare("lock_next_claimable",
               "SELECT " + columns +
                   " FROM workflow_items WHERE state='queued'"
                   " AND (next_retry_at_ms IS NULL OR next_retry_at_ms <= $1)"
                   " AND (lease_holder IS NULL OR lease_acquired_at_ms IS NULL OR lease_acquired_at_ms < $2)"
                   " ORDER BY priority DESC, queued_at_ms ASC NULLS LAST, created_at_ms ASC, id ASC"
                   " LIMIT 1 FOR UPDATE SKIP LOCKED");

  conn.prepare("insert_workflow", "INSERT INTO workflow_items(" + columns +
                                      ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21)");

  conn.prepare("update_workflow",
               "UPDATE workflow_items SET state=$2,version=$3,stage=$4,priority=$5,retry_count=$6,max_retries=$7,"
               "next_retry_at_ms=$8,payload=$9,stage_details=$10,partial_results=$11,quota_exceeded_count=$12,"
               "last_quota_check_ms=$13,lease_holder=$14,lease_acquired_at_ms=$15,last_error=$16,created_at_ms=$17,"
               "state_entered_at_ms=$18,queued_at_ms=$19,processing_started_at_ms=$20,completed_at_ms=$21 WHERE id=$1");

  conn.prepare("insert_transition",
               "INSERT INTO workflow_transitions(transition_id,workflow_id,from_state,to_state,stage,reason,metadata,actor,created_at_ms)"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING seq");

  conn.prepare("insert_event",
               "INSERT INTO workflow_events(event_id,workflow_id,event_type,event_data,processed,created_at_ms)"
               " VALUES($1,$2,$3,$4,$5,$6) RETURNING seq");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace workflow::db::postgres
