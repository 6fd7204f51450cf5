#include "internal/core/transition_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using workflow::core::TransitionEngine;
using workflow::core::TransitionRequest;
using workflow::db::memory::MemoryRepository;
using workflow::db::model::WorkflowRecord;
using workflow::events::EventEmitter;
using workflow::model::WorkflowState;
using workflow::util::ManualClock;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(workflow::util::FromUnixMillis(1'700'000'000'000));
  std::shared_ptr<EventEmitter>     emitter = std::make_shared<EventEmitter>(repo, clock);
  TransitionEngine                  engine{repo, emitter, clock};

  void Seed(const std::string& id, WorkflowState state) {
    WorkflowRecord record;
    record.id                  = id;
    record.state               = state;
    record.created_at_ms       = clock->NowMillis();
    record.state_entered_at_ms = clock->NowMillis();

    auto tx = repo->Begin();
    assert(repo->InsertWorkflow(*tx, record));
    tx->Commit();
  }

  WorkflowRecord Load(const std::string& id) {
    auto tx     = repo->Begin();
    auto record = repo->GetWorkflow(*tx, id);
    tx->Commit();
    assert(record.has_value());
    return *record;
  }

  std::size_t TransitionCount(const std::string& id) {
    auto tx      = repo->Begin();
    auto history = repo->ListTransitions(*tx, id);
    tx->Commit();
    return history.size();
  }
};

TransitionRequest Request(const std::string& id, WorkflowState from, WorkflowState to) {
  TransitionRequest request;
  request.workflow_id = id;
  request.from        = from;
  request.to          = to;
  return request;
}

void TestMismatchLeavesItemUntouched() {
  Fixture f;
  f.Seed("wf-mismatch", WorkflowState::kQueued);

  assert(!f.engine.Transition(Request("wf-mismatch", WorkflowState::kCreated, WorkflowState::kQueued)));

  const auto record = f.Load("wf-mismatch");
  assert(record.state == WorkflowState::kQueued);
  assert(record.version == 1);
  assert(f.TransitionCount("wf-mismatch") == 0);
  assert(f.emitter->ForWorkflow("wf-mismatch").empty());
}

void TestAppliedTransitionWritesOneRecordAndOneEvent() {
  Fixture f;
  f.Seed("wf-apply", WorkflowState::kQueued);

  auto request     = Request("wf-apply", WorkflowState::kQueued, WorkflowState::kProcessing);
  request.stage    = "scrape";
  request.reason   = "claimed";
  request.metadata = {{"worker", std::string("w1")}, {"attempt", std::int64_t{1}}};
  request.actor    = "w1";
  assert(f.engine.Transition(request));

  const auto record = f.Load("wf-apply");
  assert(record.state == WorkflowState::kProcessing);
  assert(record.version == 2);
  assert(record.stage == "scrape");
  assert(record.processing_started_at_ms == f.clock->NowMillis());

  const auto details = workflow::model::DecodeAttributes(record.stage_details);
  assert(std::get<std::string>(details.at("worker")) == "w1");

  auto tx      = f.repo->Begin();
  auto history = f.repo->ListTransitions(*tx, "wf-apply");
  tx->Commit();
  assert(history.size() == 1);
  assert(history[0].from_state == WorkflowState::kQueued);
  assert(history[0].to_state == WorkflowState::kProcessing);
  assert(history[0].actor == "w1");
  assert(history[0].reason == "claimed");

  const auto events = f.emitter->ForWorkflow("wf-apply");
  assert(events.size() == 1);
  assert(events[0].event_type == "state_changed");
  assert(!events[0].processed);
}

void TestIllegalEdgesAndUnknownIds() {
  Fixture f;
  f.Seed("wf-done", WorkflowState::kCompleted);

  bool threw = false;
  try {
    f.engine.Transition(Request("wf-done", WorkflowState::kCompleted, WorkflowState::kQueued));
  } catch (const workflow::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.Load("wf-done").version == 1);

  threw = false;
  try {
    f.engine.Transition(Request("missing", WorkflowState::kQueued, WorkflowState::kProcessing));
  } catch (const workflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // Self-edges exist only for processing and quota_exceeded.
  threw = false;
  try {
    f.engine.Transition(Request("wf-done", WorkflowState::kQueued, WorkflowState::kQueued));
  } catch (const workflow::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestQuotaCountedOncePerEntry() {
  Fixture f;
  f.Seed("wf-quota", WorkflowState::kProcessing);

  assert(f.engine.Transition(Request("wf-quota", WorkflowState::kProcessing, WorkflowState::kQuotaExceeded)));
  assert(f.Load("wf-quota").quota_exceeded_count == 1);
  const auto first_check = f.Load("wf-quota").last_quota_check_ms;

  f.clock->Advance(std::chrono::seconds(10));
  assert(f.engine.Transition(Request("wf-quota", WorkflowState::kQuotaExceeded, WorkflowState::kQuotaExceeded)));
  assert(f.Load("wf-quota").quota_exceeded_count == 1);
  assert(f.Load("wf-quota").last_quota_check_ms == first_check);

  assert(f.engine.Transition(Request("wf-quota", WorkflowState::kQuotaExceeded, WorkflowState::kQueued)));
  assert(f.engine.Transition(Request("wf-quota", WorkflowState::kQueued, WorkflowState::kProcessing)));
  assert(f.engine.Transition(Request("wf-quota", WorkflowState::kProcessing, WorkflowState::kQuotaExceeded)));

  const auto record = f.Load("wf-quota");
  assert(record.quota_exceeded_count == 2);
  assert(record.version == 6);
  assert(f.TransitionCount("wf-quota") == 5);
}

void TestMutatorMayNotTouchState() {
  Fixture f;
  f.Seed("wf-mutator", WorkflowState::kQueued);

  bool threw = false;
  {
    auto tx = f.repo->Begin();
    try {
      f.engine.Apply(*tx, Request("wf-mutator", WorkflowState::kQueued, WorkflowState::kProcessing),
                     [](WorkflowRecord& row) { row.state = WorkflowState::kCompleted; });
    } catch (const workflow::util::InvalidState&) {
      threw = true;
    }
  }
  assert(threw);
  assert(f.Load("wf-mutator").state == WorkflowState::kQueued);
  assert(f.TransitionCount("wf-mutator") == 0);
}

void TestStateDurationIsRecorded() {
  Fixture f;
  f.Seed("wf-duration", WorkflowState::kQueued);

  f.clock->Advance(std::chrono::seconds(30));
  auto request  = Request("wf-duration", WorkflowState::kQueued, WorkflowState::kProcessing);
  request.stage = "scrape";
  assert(f.engine.Transition(request));

  f.clock->Advance(std::chrono::seconds(12));
  request       = Request("wf-duration", WorkflowState::kProcessing, WorkflowState::kProcessing);
  request.stage = "score";
  assert(f.engine.Transition(request));

  auto tx      = f.repo->Begin();
  auto states  = f.repo->ListMetrics(*tx, "state_duration", 0);
  auto stages  = f.repo->ListMetrics(*tx, "stage_duration", 0);
  tx->Commit();

  assert(states.size() == 2);
  assert(states[0].metric_name == "queued");
  assert(states[0].metric_value == 30.0);
  assert(stages.size() == 1);
  assert(stages[0].metric_name == "scrape");
  assert(stages[0].metric_value == 12.0);
}

} // namespace

int main() {
  TestMismatchLeavesItemUntouched();
  TestAppliedTransitionWritesOneRecordAndOneEvent();
  TestIllegalEdgesAndUnknownIds();
  TestQuotaCountedOncePerEntry();
  TestMutatorMayNotTouchState();
  TestStateDurationIsRecorded();

  std::cout << "workflow_manager_unit_transition_engine: pass\n";
  return 0;
}
