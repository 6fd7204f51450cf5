#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/workflow_state.hpp"
#include "internal/util/time.hpp"

namespace workflow::views {

/*
  Read-only projections over the store.

  Windows are measured back from the clock's now. Item-based views
  select items whose queued_at falls inside the window; items never
  queued are not counted. Durations are completed_at - queued_at in
  seconds; median and p95 interpolate linearly between ranks.
*/

struct DurationStats {
  std::size_t count   = 0;
  double      average = 0.0;
  double      minimum = 0.0;
  double      maximum = 0.0;
  double      median  = 0.0;
  double      p95     = 0.0;
};

struct PerformanceRow {
  uint64_t              hour_ms = 0;
  model::WorkflowState  state   = model::WorkflowState::kCompleted;
  DurationStats         durations;
};

struct ThroughputBucket {
  uint64_t    hour_ms = 0;
  std::size_t count   = 0;
};

struct TransitionCount {
  model::WorkflowState from  = model::WorkflowState::kCreated;
  model::WorkflowState to    = model::WorkflowState::kCreated;
  std::size_t          count = 0;
};

struct Summary {
  std::chrono::seconds                        window{0};
  std::map<model::WorkflowState, std::size_t> state_distribution;
  DurationStats                               durations;
  double                                      error_rate_percent = 0.0;
  std::size_t                                 total              = 0;
  std::vector<ThroughputBucket>               throughput;
};

DurationStats ComputeDurationStats(std::vector<double> seconds);

class WorkflowViews {
 public:
  WorkflowViews(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock);

  std::map<model::WorkflowState, std::size_t> StateDistribution(std::chrono::seconds window);

  DurationStats Durations(std::chrono::seconds window);

  // Completed-at-least-once items grouped by creation hour and current state.
  std::vector<PerformanceRow> Performance();

  // Share of items in the window currently failed, in percent.
  double ErrorRate(std::chrono::seconds window);

  // Items completed per hour, newest hour first.
  std::vector<ThroughputBucket> Throughput(std::chrono::seconds window);

  std::vector<TransitionCount> TransitionCounts(std::chrono::seconds window);

  // Mean seconds spent per state, from recorded state_duration samples.
  std::map<std::string, double> AverageStateSeconds(std::chrono::seconds window);

  Summary Summarize(std::chrono::seconds window);

 private:
  std::vector<db::model::WorkflowRecord> AllWorkflows();
  uint64_t                               WindowStart(std::chrono::seconds window) const;

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace workflow::views
