#include "internal/model/payload_codec.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "internal/model/structured_payload.hpp"
#include "internal/model/workflow_state.hpp"

namespace {

using namespace workflow::model;

void TestStateNames() {
  for (auto state : kAllStates) {
    assert(ParseState(ToString(state)) == state);
    assert(StateFromString(ToString(state)) == state);
  }
  assert(ToString(WorkflowState::kQuotaExceeded) == "quota_exceeded");
  assert(ToString(WorkflowState::kPartiallyProcessed) == "partially_processed");
  assert(!ParseState("done"));

  bool threw = false;
  try {
    (void)StateFromString("QUEUED");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestTransitionTable() {
  assert(CanTransition(WorkflowState::kCreated, WorkflowState::kQueued));
  assert(CanTransition(WorkflowState::kProcessing, WorkflowState::kProcessing));
  assert(CanTransition(WorkflowState::kQuotaExceeded, WorkflowState::kQuotaExceeded));
  assert(!CanTransition(WorkflowState::kQueued, WorkflowState::kQueued));
  assert(!CanTransition(WorkflowState::kCreated, WorkflowState::kProcessing));
  assert(!CanTransition(WorkflowState::kProcessing, WorkflowState::kCancelled));

  for (auto to : kAllStates) {
    assert(!CanTransition(WorkflowState::kCompleted, to));
    assert(!CanTransition(WorkflowState::kCancelled, to));
  }

  assert(IsFinished(WorkflowState::kFailed));
  assert(!IsTerminal(WorkflowState::kFailed));
}

void TestDecodeKeepsScalarTypes() {
  const auto attributes = DecodeAttributes(R"({"count":3,"ratio":0.25,"ok":true,"name":"scrape","gone":null,"ts":1700000000000})");
  assert(std::get<std::int64_t>(attributes.at("count")) == 3);
  assert(std::get<double>(attributes.at("ratio")) == 0.25);
  assert(std::get<bool>(attributes.at("ok")));
  assert(std::get<std::string>(attributes.at("name")) == "scrape");
  assert(std::holds_alternative<std::monostate>(attributes.at("gone")));
  assert(std::get<std::int64_t>(attributes.at("ts")) == 1'700'000'000'000);
  assert(attributes.size() == 6);
}

void TestDecodeFailureDetails() {
  const auto details = DecodeAttributes(R"({"failure_kind":"transient","retry_count":4,"worker_id":"w"})");
  assert(details.size() == 3);
  assert(std::get<std::string>(details.at("failure_kind")) == "transient");
  assert(std::get<std::int64_t>(details.at("retry_count")) == 4);

  Attributes written{{"stage", std::string("")}, {"worker_id", std::string("w")}, {"failure_kind", std::string("permanent")}};
  const auto read = DecodeAttributes(EncodeAttributes(written));
  assert(read.size() == 3);
  assert(std::get<std::string>(read.at("failure_kind")) == "permanent");
  assert(std::get<std::string>(read.at("stage")).empty());
}

void TestNestedValuesStayJsonText() {
  const auto attributes = DecodeAttributes(R"({"result":{"rows":2},"tags":["a","b"]})");

  const auto nested = DecodeAttributes(std::get<std::string>(attributes.at("result")));
  assert(std::get<std::int64_t>(nested.at("rows")) == 2);

  const auto& tags = std::get<std::string>(attributes.at("tags"));
  assert(tags.find("\"a\"") != std::string::npos);
  assert(tags.find("\"b\"") != std::string::npos);
}

void TestObjectValidation() {
  assert(IsJsonObject("{}"));
  assert(IsJsonObject(R"({"a":{"b":[1,2]}})"));
  assert(!IsJsonObject("[1,2]"));
  assert(!IsJsonObject("not json"));
  assert(ParseObject("").fields().empty());

  bool threw = false;
  try {
    (void)DecodeAttributes("{\"a\":");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestTypedPayloads() {
  StateChanged changed;
  changed.transition_id = "t-1";
  changed.from_state    = WorkflowState::kQueued;
  changed.to_state      = WorkflowState::kProcessing;
  changed.reason        = "claimed";

  const auto fields = DecodeAttributes(EncodeJson(changed));
  assert(std::get<std::string>(fields.at("from_state")) == "queued");
  assert(std::get<std::string>(fields.at("to_state")) == "processing");
  assert(std::get<std::string>(fields.at("reason")) == "claimed");
  assert(EventTypeOf(changed) == "state_changed");

  LeaseChanged takeover{LeaseChange::kTakenOver, "w2", "w1"};
  const auto   lease = DecodeAttributes(EncodeJson(takeover));
  assert(std::get<std::string>(lease.at("change")) == "taken_over");
  assert(std::get<std::string>(lease.at("previous_holder")) == "w1");
  assert(EventTypeOf(takeover) == "lease_taken_over");

  LeaseChanged acquired{LeaseChange::kAcquired, "w1", ""};
  assert(DecodeAttributes(EncodeJson(acquired)).count("previous_holder") == 0);

  QuotaExhausted quota;
  quota.service_name = "openai";
  quota.quota_types  = {"requests_per_minute", "tokens_per_day"};
  quota.wait_seconds = 40;
  const auto parsed  = ParseObject(EncodeJson(quota));
  assert(parsed.fields().at("quota_types").list_value().values_size() == 2);
  assert(parsed.fields().at("wait_seconds").number_value() == 40);
  assert(EventTypeOf(quota) == "quota_exceeded");

  assert(EventTypeOf(Enqueued{}) == "workflow_created");
  assert(EventTypeOf(Attributes{}) == "custom");
}

void TestMergeOverlays() {
  Attributes base{{"stage", std::string("fetch")}, {"pages", std::int64_t{1}}};
  const auto merged = Merge(base, {{"pages", std::int64_t{4}}, {"done", true}});
  assert(merged.size() == 3);
  assert(std::get<std::int64_t>(merged.at("pages")) == 4);
  assert(std::get<std::string>(merged.at("stage")) == "fetch");
  assert(std::get<bool>(merged.at("done")));
}

} // namespace

int main() {
  TestStateNames();
  TestTransitionTable();
  TestDecodeKeepsScalarTypes();
  TestDecodeFailureDetails();
  TestNestedValuesStayJsonText();
  TestObjectValidation();
  TestTypedPayloads();
  TestMergeOverlays();

  std::cout << "workflow_manager_unit_payload_codec: pass\n";
  return 0;
}
