#include "workflow_views.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <optional>
#include <utility>

namespace workflow::views {

using model::WorkflowState;

namespace {

constexpr uint64_t kHourMs = 60ull * 60ull * 1000ull;

double Percentile(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  const double position = fraction * static_cast<double>(sorted.size() - 1);
  const auto   lower    = static_cast<std::size_t>(std::floor(position));
  const auto   upper    = std::min(lower + 1, sorted.size() - 1);
  const double weight   = position - static_cast<double>(lower);
  return sorted[lower] + (sorted[upper] - sorted[lower]) * weight;
}

bool QueuedSince(const db::model::WorkflowRecord& record, uint64_t since_ms) {
  return record.queued_at_ms && *record.queued_at_ms >= since_ms;
}

std::optional<double> DurationSeconds(const db::model::WorkflowRecord& record) {
  if (!record.queued_at_ms || !record.completed_at_ms || *record.completed_at_ms < *record.queued_at_ms) return std::nullopt;
  return static_cast<double>(*record.completed_at_ms - *record.queued_at_ms) / 1000.0;
}

} // namespace

DurationStats ComputeDurationStats(std::vector<double> seconds) {
  DurationStats stats;
  if (seconds.empty()) return stats;

  std::sort(seconds.begin(), seconds.end());
  double sum = 0.0;
  for (double value : seconds) sum += value;

  stats.count   = seconds.size();
  stats.average = sum / static_cast<double>(seconds.size());
  stats.minimum = seconds.front();
  stats.maximum = seconds.back();
  stats.median  = Percentile(seconds, 0.5);
  stats.p95     = Percentile(seconds, 0.95);
  return stats;
}

WorkflowViews::WorkflowViews(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::vector<db::model::WorkflowRecord> WorkflowViews::AllWorkflows() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListWorkflows(*tx, db::WorkflowFilter{});
  tx->Commit();
  return rows;
}

uint64_t WorkflowViews::WindowStart(std::chrono::seconds window) const {
  const uint64_t now  = clock_->NowMillis();
  const auto     span = static_cast<uint64_t>(std::max<int64_t>(0, window.count())) * 1000ull;
  return now > span ? now - span : 0;
}

std::map<WorkflowState, std::size_t> WorkflowViews::StateDistribution(std::chrono::seconds window) {
  const uint64_t since = WindowStart(window);

  std::map<WorkflowState, std::size_t> distribution;
  for (const auto& record : AllWorkflows()) {
    if (QueuedSince(record, since)) ++distribution[record.state];
  }
  return distribution;
}

DurationStats WorkflowViews::Durations(std::chrono::seconds window) {
  const uint64_t since = WindowStart(window);

  std::vector<double> seconds;
  for (const auto& record : AllWorkflows()) {
    if (!QueuedSince(record, since)) continue;
    if (auto duration = DurationSeconds(record)) seconds.push_back(*duration);
  }
  return ComputeDurationStats(std::move(seconds));
}

std::vector<PerformanceRow> WorkflowViews::Performance() {
  std::map<std::pair<uint64_t, WorkflowState>, std::vector<double>> groups;
  for (const auto& record : AllWorkflows()) {
    if (auto duration = DurationSeconds(record)) {
      groups[{record.created_at_ms / kHourMs * kHourMs, record.state}].push_back(*duration);
    }
  }

  std::vector<PerformanceRow> rows;
  rows.reserve(groups.size());
  for (auto& [key, seconds] : groups) {
    PerformanceRow row;
    row.hour_ms   = key.first;
    row.state     = key.second;
    row.durations = ComputeDurationStats(std::move(seconds));
    rows.push_back(row);
  }
  return rows;
}

double WorkflowViews::ErrorRate(std::chrono::seconds window) {
  const uint64_t since = WindowStart(window);

  std::size_t total  = 0;
  std::size_t failed = 0;
  for (const auto& record : AllWorkflows()) {
    if (!QueuedSince(record, since)) continue;
    ++total;
    if (record.state == WorkflowState::kFailed) ++failed;
  }
  return total == 0 ? 0.0 : static_cast<double>(failed) * 100.0 / static_cast<double>(total);
}

std::vector<ThroughputBucket> WorkflowViews::Throughput(std::chrono::seconds window) {
  const uint64_t since = WindowStart(window);

  std::map<uint64_t, std::size_t, std::greater<>> per_hour;
  for (const auto& record : AllWorkflows()) {
    if (record.completed_at_ms && *record.completed_at_ms >= since) ++per_hour[*record.completed_at_ms / kHourMs * kHourMs];
  }

  std::vector<ThroughputBucket> buckets;
  buckets.reserve(per_hour.size());
  for (const auto& [hour, count] : per_hour) buckets.push_back({hour, count});
  return buckets;
}

std::vector<TransitionCount> WorkflowViews::TransitionCounts(std::chrono::seconds window) {
  auto tx          = repository_->Begin();
  auto transitions = repository_->ListTransitionsSince(*tx, WindowStart(window));
  tx->Commit();

  std::map<std::pair<WorkflowState, WorkflowState>, std::size_t> counts;
  for (const auto& transition : transitions) ++counts[{transition.from_state, transition.to_state}];

  std::vector<TransitionCount> result;
  result.reserve(counts.size());
  for (const auto& [edge, count] : counts) result.push_back({edge.first, edge.second, count});
  return result;
}

std::map<std::string, double> WorkflowViews::AverageStateSeconds(std::chrono::seconds window) {
  auto tx      = repository_->Begin();
  auto samples = repository_->ListMetrics(*tx, "state_duration", WindowStart(window));
  tx->Commit();

  std::map<std::string, std::pair<double, std::size_t>> totals;
  for (const auto& sample : samples) {
    auto& [sum, count] = totals[sample.metric_name];
    sum += sample.metric_value;
    ++count;
  }

  std::map<std::string, double> averages;
  for (const auto& [state, total] : totals) averages[state] = total.first / static_cast<double>(total.second);
  return averages;
}

Summary WorkflowViews::Summarize(std::chrono::seconds window) {
  const uint64_t since = WindowStart(window);

  Summary             summary;
  std::size_t         failed = 0;
  std::vector<double> seconds;
  summary.window = window;

  for (const auto& record : AllWorkflows()) {
    if (!QueuedSince(record, since)) continue;
    ++summary.total;
    ++summary.state_distribution[record.state];
    if (record.state == WorkflowState::kFailed) ++failed;
    if (auto duration = DurationSeconds(record)) seconds.push_back(*duration);
  }

  summary.durations          = ComputeDurationStats(std::move(seconds));
  summary.error_rate_percent = summary.total == 0 ? 0.0 : static_cast<double>(failed) * 100.0 / static_cast<double>(summary.total);
  summary.throughput         = Throughput(window);
  return summary;
}

} // namespace workflow::views
