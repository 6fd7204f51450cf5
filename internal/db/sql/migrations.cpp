#include "migrations.hpp"

namespace workflow::db::sql {

std::vector<Migration> SqliteMigrations() {
  return {
      {1,
       "workflow state management",
       {
           "CREATE TABLE IF NOT EXISTS workflow_items ("
           " id TEXT PRIMARY KEY, state TEXT NOT NULL, version INTEGER NOT NULL, stage TEXT NOT NULL DEFAULT '',"
           " priority INTEGER NOT NULL DEFAULT 0, retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
           " next_retry_at_ms INTEGER, payload TEXT NOT NULL DEFAULT '{}', stage_details TEXT NOT NULL DEFAULT '{}',"
           " partial_results TEXT, quota_exceeded_count INTEGER NOT NULL DEFAULT 0, last_quota_check_ms INTEGER,"
           " lease_holder TEXT, lease_acquired_at_ms INTEGER, last_error TEXT, created_at_ms INTEGER NOT NULL,"
           " state_entered_at_ms INTEGER NOT NULL, queued_at_ms INTEGER, processing_started_at_ms INTEGER, completed_at_ms INTEGER);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_items_claim ON workflow_items(state, priority DESC, queued_at_ms);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_items_retry ON workflow_items(state, next_retry_at_ms);",
           "CREATE TABLE IF NOT EXISTS workflow_transitions ("
           " seq INTEGER PRIMARY KEY AUTOINCREMENT, transition_id TEXT NOT NULL UNIQUE,"
           " workflow_id TEXT NOT NULL REFERENCES workflow_items(id), from_state TEXT NOT NULL, to_state TEXT NOT NULL,"
           " stage TEXT NOT NULL DEFAULT '', reason TEXT NOT NULL DEFAULT '', metadata TEXT NOT NULL DEFAULT '{}',"
           " actor TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_transitions_workflow ON workflow_transitions(workflow_id, seq);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_transitions_created ON workflow_transitions(created_at_ms);",
           "CREATE TABLE IF NOT EXISTS workflow_events ("
           " seq INTEGER PRIMARY KEY AUTOINCREMENT, event_id TEXT NOT NULL UNIQUE,"
           " workflow_id TEXT NOT NULL REFERENCES workflow_items(id), event_type TEXT NOT NULL,"
           " event_data TEXT NOT NULL DEFAULT '{}', processed INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_events_unprocessed ON workflow_events(processed, seq);",
           "CREATE TABLE IF NOT EXISTS workflow_metrics ("
           " metric_id TEXT PRIMARY KEY, workflow_id TEXT, metric_type TEXT NOT NULL, metric_name TEXT NOT NULL,"
           " metric_value REAL NOT NULL, metadata TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_metrics_type ON workflow_metrics(metric_type, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS dead_letter_queue ("
           " deadletter_id TEXT PRIMARY KEY, workflow_id TEXT NOT NULL UNIQUE REFERENCES workflow_items(id),"
           " original_data TEXT NOT NULL, error_message TEXT NOT NULL, error_details TEXT NOT NULL DEFAULT '{}',"
           " failure_count INTEGER NOT NULL DEFAULT 1, last_failure_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL,"
           " resolved_at_ms INTEGER, resolution_notes TEXT);",
       }},
      {2,
       "quota management",
       {
           "CREATE TABLE IF NOT EXISTS quota_usage_log ("
           " seq INTEGER PRIMARY KEY AUTOINCREMENT, log_id TEXT NOT NULL UNIQUE, workflow_id TEXT,"
           " service_name TEXT NOT NULL, usage_data TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_quota_usage_service ON quota_usage_log(service_name, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS quota_limits ("
           " limit_id TEXT PRIMARY KEY, service_name TEXT NOT NULL, quota_type TEXT NOT NULL,"
           " limit_value INTEGER NOT NULL, window_seconds INTEGER NOT NULL, is_active INTEGER NOT NULL DEFAULT 1,"
           " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, UNIQUE(service_name, quota_type));",
       }},
  };
}

std::vector<Migration> PostgresMigrations() {
  return {
      {1,
       "workflow state management",
       {
           "CREATE TABLE IF NOT EXISTS workflow_items ("
           " id TEXT PRIMARY KEY, state TEXT NOT NULL, version BIGINT NOT NULL, stage TEXT NOT NULL DEFAULT '',"
           " priority INTEGER NOT NULL DEFAULT 0, retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
           " next_retry_at_ms BIGINT, payload JSONB NOT NULL DEFAULT '{}', stage_details JSONB NOT NULL DEFAULT '{}',"
           " partial_results JSONB, quota_exceeded_count INTEGER NOT NULL DEFAULT 0, last_quota_check_ms BIGINT,"
           " lease_holder TEXT, lease_acquired_at_ms BIGINT, last_error TEXT, created_at_ms BIGINT NOT NULL,"
           " state_entered_at_ms BIGINT NOT NULL, queued_at_ms BIGINT, processing_started_at_ms BIGINT, completed_at_ms BIGINT);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_items_claim ON workflow_items(state, priority DESC, queued_at_ms);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_items_retry ON workflow_items(state, next_retry_at_ms);",
           "CREATE TABLE IF NOT EXISTS workflow_transitions ("
           " seq BIGSERIAL PRIMARY KEY, transition_id TEXT NOT NULL UNIQUE,"
           " workflow_id TEXT NOT NULL REFERENCES workflow_items(id), from_state TEXT NOT NULL, to_state TEXT NOT NULL,"
           " stage TEXT NOT NULL DEFAULT '', reason TEXT NOT NULL DEFAULT '', metadata JSONB NOT NULL DEFAULT '{}',"
           " actor TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_transitions_workflow ON workflow_transitions(workflow_id, seq);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_transitions_created ON workflow_transitions(created_at_ms);",
           "CREATE TABLE IF NOT EXISTS workflow_events ("
           " seq BIGSERIAL PRIMARY KEY, event_id TEXT NOT NULL UNIQUE,"
           " workflow_id TEXT NOT NULL REFERENCES workflow_items(id), event_type TEXT NOT NULL,"
           " event_data JSONB NOT NULL DEFAULT '{}', processed BOOLEAN NOT NULL DEFAULT FALSE, created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_events_unprocessed ON workflow_events(processed, seq);",
           "CREATE TABLE IF NOT EXISTS workflow_metrics ("
           " metric_id TEXT PRIMARY KEY, workflow_id TEXT, metric_type TEXT NOT NULL, metric_name TEXT NOT NULL,"
           " metric_value DOUBLE PRECISION NOT NULL, metadata JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_workflow_metrics_type ON workflow_metrics(metric_type, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS dead_letter_queue ("
           " deadletter_id TEXT PRIMARY KEY, workflow_id TEXT NOT NULL UNIQUE REFERENCES workflow_items(id),"
           " original_data JSONB NOT NULL, error_message TEXT NOT NULL, error_details JSONB NOT NULL DEFAULT '{}',"
           " failure_count INTEGER NOT NULL DEFAULT 1, last_failure_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL,"
           " resolved_at_ms BIGINT, resolution_notes TEXT);",
       }},
      {2,
       "quota management",
       {
           "CREATE TABLE IF NOT EXISTS quota_usage_log ("
           " seq BIGSERIAL PRIMARY KEY, log_id TEXT NOT NULL UNIQUE, workflow_id TEXT,"
           " service_name TEXT NOT NULL, usage_data JSONB NOT NULL, created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_quota_usage_service ON quota_usage_log(service_name, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS quota_limits ("
           " limit_id TEXT PRIMARY KEY, service_name TEXT NOT NULL, quota_type TEXT NOT NULL,"
           " limit_value BIGINT NOT NULL, window_seconds BIGINT NOT NULL, is_active BOOLEAN NOT NULL DEFAULT TRUE,"
           " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, UNIQUE(service_name, quota_type));",
       }},
  };
}

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, uint64_t now_ms) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, description TEXT NOT NULL, applied_at_ms BIGINT NOT NULL);");

  for (const auto& migration : ordered) {
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.ExecuteSQL("INSERT INTO schema_migrations(version, description, applied_at_ms) VALUES(" + std::to_string(migration.version) + ", '" +
                        migration.description + "', " + std::to_string(now_ms) + ") ON CONFLICT(version) DO NOTHING;");
  }
}

} // namespace workflow::db::sql
