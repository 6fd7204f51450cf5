#include <assert.h>

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/factory.hpp"
#include "internal/model/workflow_state.hpp"
#include "internal/util/time.hpp"

namespace {

using workflow::model::WorkflowState;

constexpr uint64_t kStartMs = 1'700'000'000'000;

// Releases every waiting thread at once.
class StartGate {
 public:
  void Wait() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return open_; });
  }

  void Open() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mu_;
  std::condition_variable cv_;
  bool                    open_ = false;
};

workflow::factory::Runtime MakeRuntime() {
  auto clock = std::make_shared<workflow::util::ManualClock>(workflow::util::FromUnixMillis(kStartMs));
  return workflow::factory::Build(workflow::runtime::config::RuntimeConfig{}, clock);
}

void TestSingleItemHasOneWinner() {
  auto       rt = MakeRuntime();
  const auto id = rt.manager->EnqueueAndQueue(R"({"url":"https://example.com"})");

  constexpr int    kWorkers = 8;
  StartGate        gate;
  std::atomic<int> winners{0};
  std::mutex       mu;
  std::string      winner;

  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i] {
      const std::string worker = "worker-" + std::to_string(i);
      gate.Wait();
      if (auto claimed = rt.manager->ClaimNext(worker)) {
        assert(claimed->id == id);
        winners.fetch_add(1);
        std::lock_guard<std::mutex> lock(mu);
        winner = worker;
      }
    });
  }
  gate.Open();
  for (auto& thread : threads) thread.join();

  assert(winners.load() == 1);
  const auto record = rt.manager->Get(id);
  assert(record->state == WorkflowState::kProcessing);
  assert(record->lease_holder == winner);
  assert(record->version == 3);
  assert(rt.manager->History(id).size() == 2);
}

void TestEveryItemClaimedOnce() {
  auto rt = MakeRuntime();

  constexpr int         kItems   = 40;
  constexpr int         kWorkers = 6;
  std::set<std::string> ids;
  for (int i = 0; i < kItems; ++i) ids.insert(rt.manager->EnqueueAndQueue("{}"));

  StartGate                          gate;
  std::mutex                         mu;
  std::map<std::string, std::string> claimed_by;
  int                                duplicates = 0;

  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i] {
      const std::string worker = "worker-" + std::to_string(i);
      gate.Wait();
      while (auto claimed = rt.manager->ClaimNext(worker)) {
        const bool completed = rt.manager->Complete(claimed->id, worker);
        std::lock_guard<std::mutex> lock(mu);
        assert(completed);
        if (!claimed_by.emplace(claimed->id, worker).second) ++duplicates;
      }
    });
  }
  gate.Open();
  for (auto& thread : threads) thread.join();

  assert(duplicates == 0);
  assert(claimed_by.size() == ids.size());
  for (const auto& id : ids) {
    assert(claimed_by.count(id) == 1);
    assert(rt.manager->Get(id)->state == WorkflowState::kCompleted);
  }
  assert(!rt.manager->ClaimNext("late-worker"));
}

} // namespace

int main() {
  TestSingleItemHasOneWinner();
  TestEveryItemClaimedOnce();

  std::cout << "workflow_manager_unit_claim_concurrency: pass\n";
  return 0;
}
