#pragma once

namespace workflow::db::sql {

/*
  Column lists shared by the SQL backends.

  The order here is the bind/read order used by both
  SqliteRepository and PgRepository; keep them in sync.
*/

static constexpr const char* kWorkflowColumns =
    "id,state,version,stage,priority,retry_count,max_retries,next_retry_at_ms,"
    "payload,stage_details,partial_results,quota_exceeded_count,last_quota_check_ms,"
    "lease_holder,lease_acquired_at_ms,last_error,created_at_ms,state_entered_at_ms,"
    "queued_at_ms,processing_started_at_ms,completed_at_ms";

static constexpr int kWorkflowColumnCount = 21;

static constexpr const char* kTransitionColumns =
    "transition_id,workflow_id,from_state,to_state,stage,reason,metadata,actor,created_at_ms,seq";

static constexpr const char* kEventColumns = "event_id,workflow_id,event_type,event_data,processed,created_at_ms,seq";

static constexpr const char* kMetricColumns = "metric_id,workflow_id,metric_type,metric_name,metric_value,metadata,created_at_ms";

static constexpr const char* kDeadLetterColumns =
    "deadletter_id,workflow_id,original_data,error_message,error_details,failure_count,"
    "last_failure_at_ms,created_at_ms,resolved_at_ms,resolution_notes";

static constexpr const char* kQuotaUsageColumns = "log_id,workflow_id,service_name,usage_data,created_at_ms,seq";

static constexpr const char* kQuotaLimitColumns =
    "limit_id,service_name,quota_type,limit_value,window_seconds,is_active,created_at_ms,updated_at_ms";

} // namespace workflow::db::sql
