#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace workflow::db::memory {

using workflow::model::WorkflowState;

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MatchesFilter(const model::WorkflowRecord& r, const WorkflowFilter& filter) {
  if (!filter.states.empty() && std::find(filter.states.begin(), filter.states.end(), r.state) == filter.states.end()) {
    return false;
  }
  if (filter.retry_due_at_ms && (!r.next_retry_at_ms || *r.next_retry_at_ms > *filter.retry_due_at_ms)) {
    return false;
  }
  return true;
}

bool IsClaimable(const model::WorkflowRecord& r, const ClaimCriteria& criteria) {
  if (r.state != WorkflowState::kQueued) return false;
  if (r.next_retry_at_ms && *r.next_retry_at_ms > criteria.now_ms) return false;
  if (r.lease_holder && r.lease_acquired_at_ms && *r.lease_acquired_at_ms >= criteria.lease_cutoff_ms) return false;
  return true;
}

// priority desc, queued_at asc (unset last), created_at asc, id asc
bool ClaimsBefore(const model::WorkflowRecord& a, const model::WorkflowRecord& b) {
  if (a.priority != b.priority) return a.priority > b.priority;
  if (a.queued_at_ms != b.queued_at_ms) {
    if (!a.queued_at_ms) return false;
    if (!b.queued_at_ms) return true;
    return *a.queued_at_ms < *b.queued_at_ms;
  }
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// ------------------------------------------------------------------
// Workflow items
// ------------------------------------------------------------------

Result MemoryRepository::InsertWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.workflows.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "workflow " + r.id);
  s.workflows[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkflowRecord> MemoryRepository::GetWorkflow(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workflows.find(id);
  if (it == s.workflows.end()) return std::nullopt;
  return it->second;
}

std::optional<model::WorkflowRecord> MemoryRepository::LockWorkflow(Transaction& t, const std::string& id) {
  // The transaction already holds the store exclusively.
  return GetWorkflow(t, id);
}

std::optional<model::WorkflowRecord> MemoryRepository::LockNextClaimable(Transaction& t, const ClaimCriteria& criteria) {
  const auto&                  s    = TX(t).View();
  const model::WorkflowRecord* best = nullptr;
  for (const auto& [_, record] : s.workflows) {
    if (!IsClaimable(record, criteria)) continue;
    if (!best || ClaimsBefore(record, *best)) best = &record;
  }
  if (!best) return std::nullopt;
  return *best;
}

Result MemoryRepository::UpdateWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workflows.find(r.id);
  if (it == s.workflows.end()) return Result::Err(ErrorCode::NotFound, "workflow " + r.id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::WorkflowRecord> MemoryRepository::ListWorkflows(Transaction& t, const WorkflowFilter& filter) {
  std::vector<model::WorkflowRecord> out;
  for (const auto& [_, record] : TX(t).View().workflows) {
    if (MatchesFilter(record, filter)) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  if (filter.limit > 0 && out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

// ------------------------------------------------------------------
// Transitions
// ------------------------------------------------------------------

Result MemoryRepository::InsertTransition(Transaction& t, model::TransitionRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_sequence++;
  s.transitions.push_back(r);
  return Result::Ok();
}

std::vector<model::TransitionRecord> MemoryRepository::ListTransitions(Transaction& t, const std::string& workflow_id) {
  std::vector<model::TransitionRecord> out;
  for (const auto& r : TX(t).View().transitions)
    if (r.workflow_id == workflow_id) out.push_back(r);
  return out;
}

std::vector<model::TransitionRecord> MemoryRepository::ListTransitionsSince(Transaction& t, uint64_t since_ms) {
  std::vector<model::TransitionRecord> out;
  for (const auto& r : TX(t).View().transitions)
    if (r.created_at_ms >= since_ms) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_sequence++;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const std::string& workflow_id) {
  std::vector<model::EventRecord> out;
  for (const auto& r : TX(t).View().events)
    if (r.workflow_id == workflow_id) out.push_back(r);
  return out;
}

std::vector<model::EventRecord> MemoryRepository::ListUnprocessedEvents(Transaction& t, std::size_t limit) {
  std::vector<model::EventRecord> out;
  for (const auto& r : TX(t).View().events) {
    if (r.processed) continue;
    out.push_back(r);
    if (limit > 0 && out.size() == limit) break;
  }
  return out;
}

Result MemoryRepository::MarkEventProcessed(Transaction& t, const std::string& event_id) {
  for (auto& r : TX(t).Mutable().events) {
    if (r.event_id == event_id) {
      r.processed = true;
      return Result::Ok();
    }
  }
  return Result::Err(ErrorCode::NotFound, "event " + event_id);
}

// ------------------------------------------------------------------
// Metrics
// ------------------------------------------------------------------

Result MemoryRepository::InsertMetric(Transaction& t, const model::MetricRecord& r) {
  TX(t).Mutable().metrics.push_back(r);
  return Result::Ok();
}

std::vector<model::MetricRecord> MemoryRepository::ListMetrics(Transaction& t, const std::string& metric_type, uint64_t since_ms) {
  std::vector<model::MetricRecord> out;
  for (const auto& r : TX(t).View().metrics) {
    if (r.created_at_ms < since_ms) continue;
    if (!metric_type.empty() && r.metric_type != metric_type) continue;
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.dead_letters.contains(r.deadletter_id) || s.dead_letter_by_workflow.contains(r.workflow_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "dead letter for workflow " + r.workflow_id);
  }
  s.dead_letters[r.deadletter_id]         = r;
  s.dead_letter_by_workflow[r.workflow_id] = r.deadletter_id;
  return Result::Ok();
}

Result MemoryRepository::UpdateDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.dead_letters.find(r.deadletter_id);
  if (it == s.dead_letters.end()) return Result::Err(ErrorCode::NotFound, "dead letter " + r.deadletter_id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::DeadLetterRecord> MemoryRepository::GetDeadLetter(Transaction& t, const std::string& deadletter_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dead_letters.find(deadletter_id);
  if (it == s.dead_letters.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DeadLetterRecord> MemoryRepository::GetDeadLetterByWorkflow(Transaction& t, const std::string& workflow_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dead_letter_by_workflow.find(workflow_id);
  if (it == s.dead_letter_by_workflow.end()) return std::nullopt;
  return s.dead_letters.at(it->second);
}

std::vector<model::DeadLetterRecord> MemoryRepository::ListDeadLetters(Transaction& t) {
  std::vector<model::DeadLetterRecord> out;
  for (const auto& [_, record] : TX(t).View().dead_letters)
    out.push_back(record);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.last_failure_at_ms != b.last_failure_at_ms) return a.last_failure_at_ms > b.last_failure_at_ms;
    return a.deadletter_id < b.deadletter_id;
  });
  return out;
}

// ------------------------------------------------------------------
// Quota
// ------------------------------------------------------------------

Result MemoryRepository::InsertQuotaUsage(Transaction& t, model::QuotaUsageRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_sequence++;
  s.quota_usage.push_back(r);
  return Result::Ok();
}

std::optional<model::QuotaUsageRecord> MemoryRepository::LatestQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  const model::QuotaUsageRecord* latest = nullptr;
  for (const auto& r : TX(t).View().quota_usage) {
    if (r.service_name != service_name || r.created_at_ms < since_ms) continue;
    if (!latest || r.created_at_ms > latest->created_at_ms ||
        (r.created_at_ms == latest->created_at_ms && r.sequence > latest->sequence)) {
      latest = &r;
    }
  }
  if (!latest) return std::nullopt;
  return *latest;
}

std::vector<model::QuotaUsageRecord> MemoryRepository::ListQuotaUsage(Transaction& t, const std::string& service_name, uint64_t since_ms) {
  std::vector<model::QuotaUsageRecord> out;
  for (const auto& r : TX(t).View().quota_usage)
    if (r.service_name == service_name && r.created_at_ms >= since_ms) out.push_back(r);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

Result MemoryRepository::UpsertQuotaLimit(Transaction& t, const model::QuotaLimitRecord& r) {
  auto& limits = TX(t).Mutable().quota_limits;
  auto  key    = std::make_pair(r.service_name, r.quota_type);
  auto  it     = limits.find(key);
  if (it == limits.end()) {
    limits.emplace(std::move(key), r);
    return Result::Ok();
  }
  it->second.limit_value    = r.limit_value;
  it->second.window_seconds = r.window_seconds;
  it->second.is_active      = r.is_active;
  it->second.updated_at_ms  = r.updated_at_ms;
  return Result::Ok();
}

std::optional<model::QuotaLimitRecord> MemoryRepository::GetQuotaLimit(Transaction& t, const std::string& service_name, const std::string& quota_type) {
  const auto& limits = TX(t).View().quota_limits;
  auto        it     = limits.find(std::make_pair(service_name, quota_type));
  if (it == limits.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QuotaLimitRecord> MemoryRepository::ListQuotaLimits(Transaction& t, const std::string& service_name) {
  std::vector<model::QuotaLimitRecord> out;
  for (const auto& [key, record] : TX(t).View().quota_limits)
    if (service_name.empty() || key.first == service_name) out.push_back(record);
  return out;
}

} // namespace workflow::db::memory
