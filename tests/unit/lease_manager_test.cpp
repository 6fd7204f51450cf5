#include "internal/lease/lease_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::db::memory::MemoryRepository;
using workflow::db::model::WorkflowRecord;
using workflow::events::EventEmitter;
using workflow::lease::LeaseManager;
using workflow::model::WorkflowState;
using workflow::util::ManualClock;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock   = std::make_shared<ManualClock>(workflow::util::FromUnixMillis(1'700'000'000'000));
  std::shared_ptr<EventEmitter>     emitter = std::make_shared<EventEmitter>(repo, clock);
  LeaseManager                      leases{repo, emitter, clock};

  explicit Fixture(const std::string& id) {
    WorkflowRecord record;
    record.id            = id;
    record.state         = WorkflowState::kProcessing;
    record.created_at_ms = clock->NowMillis();

    auto tx = repo->Begin();
    assert(repo->InsertWorkflow(*tx, record));
    tx->Commit();
  }

  std::size_t EventCount(const std::string& id, const std::string& type) {
    std::size_t count = 0;
    for (const auto& event : emitter->ForWorkflow(id)) {
      if (event.event_type == type) ++count;
    }
    return count;
  }
};

void TestLiveLeaseBlocksOtherWorkers() {
  Fixture f("wf-live");

  assert(f.leases.AcquireLease("wf-live", "worker-a", 300s));
  assert(f.leases.HolderOf("wf-live") == std::optional<std::string>("worker-a"));

  f.clock->Advance(100s);
  assert(!f.leases.AcquireLease("wf-live", "worker-b", 300s));
  assert(f.leases.HolderOf("wf-live") == std::optional<std::string>("worker-a"));

  // Exactly at the timeout the lease is still live.
  f.clock->Advance(200s);
  assert(!f.leases.AcquireLease("wf-live", "worker-b", 300s));
}

void TestStaleLeaseIsTakenOver() {
  Fixture f("wf-stale");

  assert(f.leases.AcquireLease("wf-stale", "worker-a", 300s));
  f.clock->Advance(301s);
  assert(f.leases.AcquireLease("wf-stale", "worker-b", 300s));
  assert(f.leases.HolderOf("wf-stale") == std::optional<std::string>("worker-b"));

  assert(f.EventCount("wf-stale", "lease_acquired") == 1);
  assert(f.EventCount("wf-stale", "lease_taken_over") == 1);

  // The old holder no longer owns it.
  assert(!f.leases.ReleaseLease("wf-stale", "worker-a"));
}

void TestRenewalRefreshesWithoutEvent() {
  Fixture f("wf-renew");

  assert(f.leases.AcquireLease("wf-renew", "worker-a", 300s));
  f.clock->Advance(250s);
  assert(f.leases.AcquireLease("wf-renew", "worker-a", 300s));

  // Renewed at +250s, so still live at +500s.
  f.clock->Advance(250s);
  assert(!f.leases.AcquireLease("wf-renew", "worker-b", 300s));
  assert(f.EventCount("wf-renew", "lease_acquired") == 1);
}

void TestReleaseByHolderOnly() {
  Fixture f("wf-release");

  assert(f.leases.AcquireLease("wf-release", "worker-a", 300s));
  assert(!f.leases.ReleaseLease("wf-release", "worker-b"));
  assert(f.leases.HolderOf("wf-release").has_value());

  assert(f.leases.ReleaseLease("wf-release", "worker-a"));
  assert(!f.leases.HolderOf("wf-release").has_value());
  assert(f.EventCount("wf-release", "lease_released") == 1);

  // Releasing again is a no-op.
  assert(!f.leases.ReleaseLease("wf-release", "worker-a"));

  assert(f.leases.AcquireLease("wf-release", "worker-b", 300s));
}

void TestHolderCheck() {
  WorkflowRecord record;
  record.id = "wf-check";
  LeaseManager::RequireHolderOrUnleased(record, "anyone");

  record.lease_holder = "worker-a";
  LeaseManager::RequireHolderOrUnleased(record, "worker-a");

  bool threw = false;
  try {
    LeaseManager::RequireHolderOrUnleased(record, "worker-b");
  } catch (const workflow::util::LeaseConflict&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidArguments() {
  Fixture f("wf-args");

  bool threw = false;
  try {
    f.leases.AcquireLease("missing", "worker-a", 300s);
  } catch (const workflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.leases.AcquireLease("wf-args", "", 300s);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.leases.AcquireLease("wf-args", "worker-a", 0s);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(!f.leases.HolderOf("wf-args").has_value());
}

} // namespace

int main() {
  TestLiveLeaseBlocksOtherWorkers();
  TestStaleLeaseIsTakenOver();
  TestRenewalRefreshesWithoutEvent();
  TestReleaseByHolderOnly();
  TestHolderCheck();
  TestInvalidArguments();

  std::cout << "workflow_manager_unit_lease_manager: pass\n";
  return 0;
}
