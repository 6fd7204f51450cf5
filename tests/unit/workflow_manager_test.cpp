#include "internal/core/workflow_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/model/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::factory::Runtime;
using workflow::model::WorkflowState;
using workflow::util::FromUnixMillis;
using workflow::util::ManualClock;

constexpr uint64_t kStartMs = 1'700'000'000'000;

struct Fixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(FromUnixMillis(kStartMs));
  Runtime                      rt    = workflow::factory::Build(workflow::runtime::config::RuntimeConfig{}, clock);

  workflow::core::WorkflowManager& manager() {
    return *rt.manager;
  }

  std::size_t EventCount(const std::string& id, const std::string& type) {
    std::size_t count = 0;
    for (const auto& event : rt.manager->Events(id)) {
      if (event.event_type == type) ++count;
    }
    return count;
  }
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestEnqueueCreatesItem() {
  Fixture f;
  const auto id = f.manager().Enqueue(R"({"product_id":42})", 5);

  const auto item = f.manager().Get(id);
  assert(item.has_value());
  assert(item->state == WorkflowState::kCreated);
  assert(item->version == 1);
  assert(item->priority == 5);
  assert(item->max_retries == 3);
  assert(item->created_at_ms == kStartMs);
  assert(!item->queued_at_ms.has_value());
  assert(f.EventCount(id, "workflow_created") == 1);
  assert(f.manager().History(id).empty());

  const auto empty = f.manager().Enqueue("", 0, 7);
  assert(f.manager().Get(empty)->payload == "{}");
  assert(f.manager().Get(empty)->max_retries == 7);

  assert(Throws<std::invalid_argument>([&] { f.manager().Enqueue("[1,2]"); }));
  assert(Throws<std::invalid_argument>([&] { f.manager().Enqueue("{}", 0, -1); }));

  // Created items are not claimable.
  assert(!f.manager().ClaimNext("worker-a").has_value());
}

void TestEnqueueAndQueueCommitsBothSteps() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");

  const auto item = f.manager().Get(id);
  assert(item->state == WorkflowState::kQueued);
  assert(item->version == 2);
  assert(item->queued_at_ms == kStartMs);

  const auto history = f.manager().History(id);
  assert(history.size() == 1);
  assert(history[0].from_state == WorkflowState::kCreated);
  assert(history[0].to_state == WorkflowState::kQueued);
}

void TestClaimOrderAndLease() {
  Fixture f;
  const auto low = f.manager().EnqueueAndQueue("{}", 1);
  f.clock->Advance(1s);
  const auto high_old = f.manager().EnqueueAndQueue("{}", 9);
  f.clock->Advance(1s);
  const auto high_new = f.manager().EnqueueAndQueue("{}", 9);

  auto first = f.manager().ClaimNext("worker-a");
  assert(first.has_value() && first->id == high_old);
  assert(first->state == WorkflowState::kProcessing);
  assert(first->version == 3);
  assert(first->lease_holder == std::optional<std::string>("worker-a"));
  assert(first->lease_acquired_at_ms == f.clock->NowMillis());
  assert(first->processing_started_at_ms == f.clock->NowMillis());

  assert(f.manager().ClaimNext("worker-b")->id == high_new);
  assert(f.manager().ClaimNext("worker-c")->id == low);
  assert(!f.manager().ClaimNext("worker-d").has_value());

  assert(f.EventCount(high_old, "lease_acquired") == 1);
  assert(Throws<std::invalid_argument>([&] { f.manager().ClaimNext(""); }));
}

void TestStageCompletionRequiresHolder() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");
  assert(f.manager().ClaimNext("worker-a").has_value());

  assert(Throws<workflow::util::LeaseConflict>([&] { f.manager().AdvanceStage(id, "worker-b", "scrape"); }));

  f.clock->Advance(200s);
  assert(f.manager().AdvanceStage(id, "worker-a", "scrape", {{"pages", std::int64_t{3}}}));
  auto item = f.manager().Get(id);
  assert(item->stage == "scrape");
  assert(item->version == 4);
  // Stage progress refreshes the lease.
  assert(item->lease_acquired_at_ms == f.clock->NowMillis());
  assert(std::get<std::int64_t>(workflow::model::DecodeAttributes(item->stage_details).at("pages")) == 3);

  assert(Throws<workflow::util::LeaseConflict>([&] { f.manager().Complete(id, "worker-b"); }));

  f.clock->Advance(10s);
  assert(f.manager().Complete(id, "worker-a", {{"score", 0.75}}));
  item = f.manager().Get(id);
  assert(item->state == WorkflowState::kCompleted);
  assert(!item->lease_holder.has_value());
  assert(item->completed_at_ms == f.clock->NowMillis());
  assert(f.EventCount(id, "lease_released") == 1);

  // Already completed: losing side of a race, not an error.
  assert(!f.manager().Complete(id, "worker-a"));
  assert(Throws<workflow::util::NotFound>([&] { f.manager().Complete("missing", "worker-a"); }));
}

void TestOperatorActions() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");
  assert(f.manager().ClaimNext("worker-a").has_value());

  // processing cannot be cancelled directly.
  assert(Throws<workflow::util::InvalidState>([&] { f.manager().Cancel(id, "no longer needed"); }));

  assert(f.manager().Suspend(id, "maintenance"));
  auto item = f.manager().Get(id);
  assert(item->state == WorkflowState::kSuspended);
  assert(!item->lease_holder.has_value());

  assert(Throws<workflow::util::InvalidState>([&] { f.manager().Retry(id); }));
  assert(f.manager().Resume(id));
  assert(f.manager().Get(id)->state == WorkflowState::kQueued);

  assert(f.manager().Cancel(id, "duplicate", "alice"));
  item = f.manager().Get(id);
  assert(item->state == WorkflowState::kCancelled);
  assert(item->completed_at_ms.has_value());

  const auto history = f.manager().History(id);
  assert(history.back().actor == "alice");
  assert(history.back().reason == "duplicate");

  assert(Throws<workflow::util::InvalidState>([&] { f.manager().Resume(id); }));
  assert(Throws<workflow::util::NotFound>([&] { f.manager().Suspend("missing", "x"); }));
}

void TestFailedItemsCanBeRetried() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");
  assert(f.manager().ClaimNext("worker-a").has_value());
  assert(f.manager().Fail(id, "worker-a", "bad input", workflow::retry::FailureKind::kPermanent) ==
         workflow::retry::FailureOutcome::kDeadLettered);

  assert(f.manager().Retry(id));
  auto item = f.manager().Get(id);
  assert(item->state == WorkflowState::kQueued);
  assert(item->retry_count == 0);
  assert(!item->next_retry_at_ms.has_value());

  assert(f.manager().ClaimNext("worker-b")->id == id);
  assert(f.manager().Fail(id, "worker-b", "still bad", workflow::retry::FailureKind::kPermanent) ==
         workflow::retry::FailureOutcome::kDeadLettered);

  const auto dead = f.manager().DeadLetters();
  assert(dead.size() == 1);
  assert(dead[0].failure_count == 2);
  assert(dead[0].error_message == "still bad");
}

void TestStaleProcessingItemsAreReclaimed() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");
  assert(f.manager().ClaimNext("worker-a").has_value());
  assert(f.manager().AdvanceStage(id, "worker-a", "score"));

  f.clock->Advance(300s);
  assert(!f.manager().ReclaimStale("worker-b").has_value());

  f.clock->Advance(1s);
  const auto reclaimed = f.manager().ReclaimStale("worker-b");
  assert(reclaimed.has_value() && reclaimed->id == id);
  assert(reclaimed->state == WorkflowState::kProcessing);
  assert(reclaimed->stage == "score");
  assert(reclaimed->lease_holder == std::optional<std::string>("worker-b"));
  assert(f.EventCount(id, "lease_taken_over") == 1);

  assert(Throws<workflow::util::LeaseConflict>([&] { f.manager().Complete(id, "worker-a"); }));
  assert(f.manager().Complete(id, "worker-b"));
}

void TestEventFeed() {
  Fixture f;
  const auto id = f.manager().EnqueueAndQueue("{}");

  auto events = f.manager().UnprocessedEvents();
  assert(events.size() == 2);
  assert(events[0].event_type == "workflow_created");
  assert(events[1].event_type == "state_changed");
  assert(events[0].sequence < events[1].sequence);

  f.manager().MarkEventProcessed(events[0].event_id);
  events = f.manager().UnprocessedEvents();
  assert(events.size() == 1);
  assert(f.manager().Events(id).size() == 2);
  assert(f.manager().UnprocessedEvents(1).size() == 1);
}

} // namespace

int main() {
  TestEnqueueCreatesItem();
  TestEnqueueAndQueueCommitsBothSteps();
  TestClaimOrderAndLease();
  TestStageCompletionRequiresHolder();
  TestOperatorActions();
  TestFailedItemsCanBeRetried();
  TestStaleProcessingItemsAreReclaimed();
  TestEventFeed();

  std::cout << "workflow_manager_unit_workflow_manager: pass\n";
  return 0;
}
