#include "internal/quota/quota_tracker.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::db::memory::MemoryRepository;
using workflow::quota::QuotaCounter;
using workflow::quota::QuotaTracker;
using workflow::quota::QuotaUsage;
using workflow::util::FromUnixMillis;
using workflow::util::ManualClock;

// 2023-11-14T22:13:20Z
constexpr uint64_t kStartMs = 1'700'000'000'000;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(FromUnixMillis(kStartMs));
  QuotaTracker                      tracker{repo, clock};
};

QuotaUsage Usage(const std::string& type, std::int64_t used, std::int64_t limit) {
  QuotaUsage usage;
  usage.quotas[type] = QuotaCounter{used, limit, std::max<std::int64_t>(0, limit - used)};
  return usage;
}

void TestNoSnapshotMeansUnconstrained() {
  Fixture f;
  assert(!f.tracker.CurrentUsage("gemini").has_value());
  assert(!f.tracker.IsExceeded("gemini", "tokens_per_minute"));
  assert(!f.tracker.CheckQuota("gemini").Exceeded());
  assert(f.tracker.EstimateResetTime("gemini") == f.clock->Now());
  f.tracker.Require("gemini");
}

void TestPerMinuteQuotaResetsAtNextMinute() {
  Fixture f;
  f.tracker.RecordUsage("gemini", Usage("tokens_per_minute", 4'000'000, 4'000'000));

  assert(f.tracker.IsExceeded("gemini", "tokens_per_minute"));
  assert(!f.tracker.IsExceeded("gemini", "requests_per_minute"));

  const auto check = f.tracker.CheckQuota("gemini");
  assert(check.Exceeded());
  assert(check.exhausted_types.size() == 1);
  assert(check.reset_at == FromUnixMillis(kStartMs + 40'000));
  assert(check.wait_seconds == 40);

  bool threw = false;
  try {
    f.tracker.Require("gemini");
  } catch (const workflow::util::QuotaExceeded& e) {
    threw = true;
    assert(e.ServiceName() == "gemini");
    assert(e.WaitSeconds() == 40);
  }
  assert(threw);

  // Other services are unaffected.
  f.tracker.Require("openai");
}

void TestEarliestResetWins() {
  Fixture f;
  auto usage                      = Usage("requests_per_day", 1500, 1500);
  usage.quotas["tokens_per_minute"] = QuotaCounter{10, 4'000'000, 0};
  f.tracker.RecordUsage("gemini", usage);
  assert(f.tracker.CheckQuota("gemini").wait_seconds == 40);

  f.clock->Advance(1s);
  f.tracker.RecordUsage("gemini", Usage("requests_per_day", 1500, 1500));

  // 22:13:21 to midnight.
  const auto check = f.tracker.CheckQuota("gemini");
  assert(check.reset_at == FromUnixMillis(1'700'006'400'000));
  assert(check.wait_seconds == 6399);
}

void TestLatestSnapshotWins() {
  Fixture f;
  f.tracker.RecordUsage("gemini", Usage("tokens_per_minute", 4'000'000, 4'000'000));
  assert(f.tracker.IsExceeded("gemini", "tokens_per_minute"));

  f.clock->Advance(5s);
  f.tracker.RecordUsage("gemini", Usage("tokens_per_minute", 100, 4'000'000));
  assert(!f.tracker.IsExceeded("gemini", "tokens_per_minute"));

  const auto current = f.tracker.CurrentUsage("gemini");
  assert(current.has_value());
  assert(current->quotas.at("tokens_per_minute").remaining == 3'999'900);
}

void TestSnapshotsOutsideRecencyWindowAreIgnored() {
  Fixture f;
  f.tracker.RecordUsage("gemini", Usage("tokens_per_day", 1'000'000'000, 1'000'000'000));
  assert(f.tracker.IsExceeded("gemini", "tokens_per_day"));

  f.clock->Advance(25h);
  assert(!f.tracker.IsExceeded("gemini", "tokens_per_day"));
}

void TestInactiveLimitIsNotEnforced() {
  Fixture f;
  f.tracker.UpsertLimit("gemini", "tokens_per_minute", 4'000'000, 60, false);
  f.tracker.RecordUsage("gemini", Usage("tokens_per_minute", 4'000'000, 4'000'000));
  assert(!f.tracker.IsExceeded("gemini", "tokens_per_minute"));

  f.tracker.UpsertLimit("gemini", "tokens_per_minute", 4'000'000, 60, true);
  assert(f.tracker.IsExceeded("gemini", "tokens_per_minute"));
}

void TestLimitSeedingAndValidation() {
  Fixture f;
  assert(f.tracker.SeedDefaultLimits() == 4);
  assert(f.tracker.SeedDefaultLimits() == 0);
  assert(f.tracker.ListLimits("gemini").size() == 4);

  f.tracker.UpsertLimit("gemini", "requests_per_minute", 30, 60);
  for (const auto& limit : f.tracker.ListLimits("gemini")) {
    if (limit.quota_type == "requests_per_minute") assert(limit.limit_value == 30);
  }
  assert(f.tracker.ListLimits("gemini").size() == 4);
  assert(f.tracker.ListLimits().size() == 4);

  bool threw = false;
  try {
    f.tracker.UpsertLimit("gemini", "requests_per_minute", 0, 60);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestDecodeFillsMissingRemaining() {
  const auto usage = QuotaTracker::DecodeUsage(
      R"({"service":"gemini","quotas":{"tokens_per_minute":{"used":10,"limit":25}},"cost_tracking":{"total_tokens":10,"total_cost_usd":0.5,"breakdown":{"input_tokens":7}}})");
  assert(usage.quotas.at("tokens_per_minute").remaining == 15);
  assert(usage.cost.total_tokens == 10);
  assert(usage.cost.input_tokens == 7);
  assert(usage.cost.total_cost_usd == 0.5);
}

void TestUsageSummaryBucketsByHour() {
  Fixture f;

  auto usage              = Usage("tokens_per_minute", 100, 4'000'000);
  usage.cost.total_tokens = 100;
  f.tracker.RecordUsage("gemini", usage);

  f.clock->Advance(1min);
  usage.cost.total_tokens = 300;
  f.tracker.RecordUsage("gemini", usage);

  // Next hour.
  f.clock->Advance(50min);
  usage.cost.total_tokens = 50;
  f.tracker.RecordUsage("gemini", usage);

  const auto buckets = f.tracker.UsageSummary("gemini", 24h);
  assert(buckets.size() == 2);
  assert(buckets[0].snapshots == 2);
  assert(buckets[0].total_tokens == 400);
  assert(buckets[0].avg_tokens == 200.0);
  assert(buckets[1].snapshots == 1);
}

} // namespace

int main() {
  TestNoSnapshotMeansUnconstrained();
  TestPerMinuteQuotaResetsAtNextMinute();
  TestEarliestResetWins();
  TestLatestSnapshotWins();
  TestSnapshotsOutsideRecencyWindowAreIgnored();
  TestInactiveLimitIsNotEnforced();
  TestLimitSeedingAndValidation();
  TestDecodeFillsMissingRemaining();
  TestUsageSummaryBucketsByHour();

  std::cout << "workflow_manager_unit_quota_tracker: pass\n";
  return 0;
}
