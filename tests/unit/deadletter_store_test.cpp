#include "internal/deadletter/deadletter_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using workflow::db::memory::MemoryRepository;
using workflow::db::model::WorkflowRecord;
using workflow::deadletter::DeadLetterStore;
using workflow::model::WorkflowState;
using workflow::util::ManualClock;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(workflow::util::FromUnixMillis(1'700'000'000'000));
  DeadLetterStore                   store{repo, clock};

  void Seed(const std::string& id) {
    WorkflowRecord record;
    record.id            = id;
    record.state         = WorkflowState::kFailed;
    record.created_at_ms = clock->NowMillis();

    auto tx = repo->Begin();
    assert(repo->InsertWorkflow(*tx, record));
    tx->Commit();
  }
};

void TestRepeatedFailuresUpsertOneEntry() {
  Fixture f;
  f.Seed("wf-1");

  const auto first = f.store.Record("wf-1", "{}", "timeout", {{"stage", std::string("scrape")}});
  assert(first.failure_count == 1);
  assert(first.created_at_ms == f.clock->NowMillis());

  f.clock->Advance(1h);
  const auto second = f.store.Record("wf-1", R"({"id":"wf-1"})", "parse error");
  assert(second.deadletter_id == first.deadletter_id);
  assert(second.failure_count == 2);
  assert(second.error_message == "parse error");
  assert(second.original_data == R"({"id":"wf-1"})");
  assert(second.created_at_ms == first.created_at_ms);
  assert(second.last_failure_at_ms == f.clock->NowMillis());

  const auto found = f.store.FindByWorkflow("wf-1");
  assert(found.has_value() && found->failure_count == 2);
  assert(f.store.List(false).size() == 1);
}

void TestResolutionAndRecurrence() {
  Fixture f;
  f.Seed("wf-2");
  const auto entry = f.store.Record("wf-2", "{}", "boom");

  f.clock->Advance(10min);
  const auto resolved = f.store.Resolve(entry.deadletter_id, "fixed upstream");
  assert(resolved.resolved_at_ms == f.clock->NowMillis());
  assert(resolved.resolution_notes == std::optional<std::string>("fixed upstream"));
  assert(!DeadLetterStore::IsUnresolved(resolved));
  assert(f.store.List(true).empty());
  assert(f.store.List(false).size() == 1);

  // A later failure reopens the entry.
  f.clock->Advance(1min);
  f.store.Record("wf-2", "{}", "boom again");
  assert(f.store.List(true).size() == 1);
  assert(DeadLetterStore::IsUnresolved(*f.store.Get(entry.deadletter_id)));

  bool threw = false;
  try {
    f.store.Resolve("missing", "notes");
  } catch (const workflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSnapshotCarriesNestedDocuments() {
  WorkflowRecord record;
  record.id              = "wf-snap";
  record.state           = WorkflowState::kFailed;
  record.stage           = "score";
  record.retry_count     = 4;
  record.payload         = R"({"product_id":42})";
  record.partial_results = R"({"progress_percentage":60})";
  record.last_error      = "timeout";

  const auto snapshot = workflow::model::ParseObject(DeadLetterStore::Snapshot(record));
  const auto& fields  = snapshot.fields();
  assert(fields.at("state").string_value() == "failed");
  assert(fields.at("retry_count").number_value() == 4);
  assert(fields.at("last_error").string_value() == "timeout");
  assert(fields.at("payload").struct_value().fields().at("product_id").number_value() == 42);
  assert(fields.at("partial_results").struct_value().fields().at("progress_percentage").number_value() == 60);
}

} // namespace

int main() {
  TestRepeatedFailuresUpsertOneEntry();
  TestResolutionAndRecurrence();
  TestSnapshotCarriesNestedDocuments();

  std::cout << "workflow_manager_unit_deadletter_store: pass\n";
  return 0;
}
