#include "internal/views/workflow_views.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/factory.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::model::WorkflowState;
using workflow::retry::FailureKind;
using workflow::util::FromUnixMillis;
using workflow::util::ManualClock;
using workflow::views::ComputeDurationStats;

// 2023-11-14T22:13:20Z
constexpr uint64_t kStartMs = 1'700'000'000'000;
constexpr uint64_t kHourMs  = 3'600'000;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

struct Fixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(FromUnixMillis(kStartMs));
  workflow::factory::Runtime   rt    = workflow::factory::Build(workflow::runtime::config::RuntimeConfig{}, clock);

  // Three items queued at the start: one completes after 60s, one after
  // 120s, one fails permanently after 120s. A fourth is never queued.
  std::string a, b, c;

  Fixture() {
    a = rt.manager->EnqueueAndQueue("{}", 3);
    b = rt.manager->EnqueueAndQueue("{}", 2);
    c = rt.manager->EnqueueAndQueue("{}", 1);
    rt.manager->Enqueue("{}");

    assert(rt.manager->ClaimNext("w1")->id == a);
    assert(rt.manager->ClaimNext("w2")->id == b);
    assert(rt.manager->ClaimNext("w3")->id == c);

    clock->Advance(60s);
    assert(rt.manager->Complete(a, "w1"));
    clock->Advance(60s);
    assert(rt.manager->Complete(b, "w2"));
    rt.manager->Fail(c, "w3", "bad", FailureKind::kPermanent);
  }
};

void TestDurationStatistics() {
  const auto stats = ComputeDurationStats({40, 10, 30, 20});
  assert(stats.count == 4);
  assert(Near(stats.average, 25));
  assert(Near(stats.minimum, 10));
  assert(Near(stats.maximum, 40));
  assert(Near(stats.median, 25));
  assert(Near(stats.p95, 38.5));

  const auto empty = ComputeDurationStats({});
  assert(empty.count == 0);
  assert(empty.p95 == 0.0);
}

void TestItemViews() {
  Fixture f;
  auto&   views = *f.rt.views;

  const auto distribution = views.StateDistribution(24h);
  assert(distribution.size() == 2);
  assert(distribution.at(WorkflowState::kCompleted) == 2);
  assert(distribution.at(WorkflowState::kFailed) == 1);

  const auto durations = views.Durations(24h);
  assert(durations.count == 3);
  assert(Near(durations.average, 100));
  assert(Near(durations.minimum, 60));
  assert(Near(durations.maximum, 120));
  assert(Near(durations.median, 120));

  assert(Near(views.ErrorRate(24h), 100.0 / 3.0));

  const auto throughput = views.Throughput(24h);
  assert(throughput.size() == 1);
  assert(throughput[0].hour_ms == kStartMs / kHourMs * kHourMs);
  assert(throughput[0].count == 3);

  const auto performance = views.Performance();
  assert(performance.size() == 2);
  assert(performance[0].state == WorkflowState::kCompleted);
  assert(performance[0].durations.count == 2);
  assert(Near(performance[0].durations.average, 90));
  assert(performance[1].state == WorkflowState::kFailed);

  // Nothing was queued in the last hour.
  f.clock->Advance(2h);
  assert(views.StateDistribution(1h).empty());
  assert(views.ErrorRate(1h) == 0.0);
}

void TestTransitionAndStateViews() {
  Fixture f;
  auto&   views = *f.rt.views;

  std::size_t total = 0;
  for (const auto& edge : views.TransitionCounts(24h)) {
    total += edge.count;
    if (edge.from == WorkflowState::kCreated) assert(edge.to == WorkflowState::kQueued && edge.count == 3);
    if (edge.from == WorkflowState::kQueued) assert(edge.to == WorkflowState::kProcessing && edge.count == 3);
    if (edge.to == WorkflowState::kCompleted) assert(edge.count == 2);
    if (edge.to == WorkflowState::kFailed) assert(edge.count == 1);
  }
  assert(total == 9);

  const auto seconds = views.AverageStateSeconds(24h);
  assert(Near(seconds.at("processing"), 100));
  assert(Near(seconds.at("queued"), 0));

  const auto summary = views.Summarize(24h);
  assert(summary.total == 3);
  assert(summary.durations.count == 3);
  assert(Near(summary.error_rate_percent, 100.0 / 3.0));
  assert(summary.throughput.size() == 1);
}

// A failed item sent back to the queue is no longer finished work.
void TestRetriedItemReopens() {
  Fixture f;
  auto&   views = *f.rt.views;

  f.clock->Advance(60s);
  assert(f.rt.manager->Retry(f.c));
  const auto reopened = f.rt.manager->Get(f.c);
  assert(reopened->state == WorkflowState::kQueued);
  assert(!reopened->completed_at_ms);

  const auto distribution = views.StateDistribution(24h);
  assert(distribution.at(WorkflowState::kCompleted) == 2);
  assert(distribution.at(WorkflowState::kQueued) == 1);
  assert(distribution.count(WorkflowState::kFailed) == 0);
  assert(views.Durations(24h).count == 2);
  assert(views.ErrorRate(24h) == 0.0);

  const auto throughput = views.Throughput(24h);
  assert(throughput.size() == 1);
  assert(throughput[0].count == 2);
  assert(views.Summarize(24h).durations.count == 2);

  assert(f.rt.manager->ClaimNext("w4")->id == f.c);
  f.clock->Advance(60s);
  assert(f.rt.manager->Complete(f.c, "w4"));

  const auto durations = views.Durations(24h);
  assert(durations.count == 3);
  assert(Near(durations.maximum, 240));
  assert(views.Throughput(24h)[0].count == 3);
}

} // namespace

int main() {
  TestDurationStatistics();
  TestItemViews();
  TestTransitionAndStateViews();
  TestRetriedItemReopens();

  std::cout << "workflow_manager_unit_workflow_views: pass\n";
  return 0;
}
