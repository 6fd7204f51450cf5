#include "deadletter_store.hpp"

#include <stdexcept>

#include "internal/model/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workflow::deadletter {

namespace {

using google::protobuf::Struct;

void SetString(Struct& out, const std::string& key, const std::string& value) {
  (*out.mutable_fields())[key].set_string_value(value);
}

void SetNumber(Struct& out, const std::string& key, double value) {
  (*out.mutable_fields())[key].set_number_value(value);
}

void SetOptionalMillis(Struct& out, const std::string& key, const std::optional<uint64_t>& value) {
  if (value) {
    SetNumber(out, key, static_cast<double>(*value));
  } else {
    (*out.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
  }
}

} // namespace

DeadLetterStore::DeadLetterStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

bool DeadLetterStore::IsUnresolved(const db::model::DeadLetterRecord& record) {
  return !record.resolved_at_ms || *record.resolved_at_ms < record.last_failure_at_ms;
}

std::string DeadLetterStore::Snapshot(const db::model::WorkflowRecord& record) {
  Struct doc;
  SetString(doc, "id", record.id);
  SetString(doc, "state", std::string(model::ToString(record.state)));
  SetNumber(doc, "version", static_cast<double>(record.version));
  SetString(doc, "stage", record.stage);
  SetNumber(doc, "priority", record.priority);
  SetNumber(doc, "retry_count", record.retry_count);
  SetNumber(doc, "max_retries", record.max_retries);
  SetNumber(doc, "quota_exceeded_count", record.quota_exceeded_count);
  SetNumber(doc, "created_at_ms", static_cast<double>(record.created_at_ms));
  SetOptionalMillis(doc, "queued_at_ms", record.queued_at_ms);
  SetOptionalMillis(doc, "processing_started_at_ms", record.processing_started_at_ms);
  if (record.last_error) SetString(doc, "last_error", *record.last_error);

  *(*doc.mutable_fields())["payload"].mutable_struct_value()       = model::ParseObject(record.payload);
  *(*doc.mutable_fields())["stage_details"].mutable_struct_value() = model::ParseObject(record.stage_details);
  if (!record.partial_results.empty()) {
    *(*doc.mutable_fields())["partial_results"].mutable_struct_value() = model::ParseObject(record.partial_results);
  }
  return model::PrintObject(doc);
}

db::model::DeadLetterRecord DeadLetterStore::Record(db::Transaction& tx, const std::string& workflow_id, const std::string& original_data,
                                                    const std::string& error_message, const model::Attributes& error_details) {
  const uint64_t now     = clock_->NowMillis();
  const auto     details = model::EncodeAttributes(error_details);

  auto existing = repository_->GetDeadLetterByWorkflow(tx, workflow_id);
  if (existing) {
    existing->failure_count += 1;
    existing->last_failure_at_ms = now;
    existing->original_data      = original_data;
    existing->error_message      = error_message;
    existing->error_details      = details;
    db::ThrowIfDbError(repository_->UpdateDeadLetter(tx, *existing), "update dead letter");
    return *existing;
  }

  db::model::DeadLetterRecord entry;
  entry.deadletter_id      = util::NewId();
  entry.workflow_id        = workflow_id;
  entry.original_data      = original_data;
  entry.error_message      = error_message;
  entry.error_details      = details;
  entry.failure_count      = 1;
  entry.last_failure_at_ms = now;
  entry.created_at_ms      = now;
  db::ThrowIfDbError(repository_->InsertDeadLetter(tx, entry), "insert dead letter");
  return entry;
}

db::model::DeadLetterRecord DeadLetterStore::Record(const std::string& workflow_id, const std::string& original_data,
                                                    const std::string& error_message, const model::Attributes& error_details) {
  auto tx    = repository_->Begin();
  auto entry = Record(*tx, workflow_id, original_data, error_message, error_details);
  tx->Commit();
  return entry;
}

db::model::DeadLetterRecord DeadLetterStore::Resolve(const std::string& deadletter_id, const std::string& notes) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetDeadLetter(*tx, deadletter_id);
  if (!entry) throw util::NotFound("resolve dead letter: " + deadletter_id + " not found");

  entry->resolved_at_ms   = clock_->NowMillis();
  entry->resolution_notes = notes;
  db::ThrowIfDbError(repository_->UpdateDeadLetter(*tx, *entry), "resolve dead letter");
  tx->Commit();

  WORKFLOW_LOG_INFO("dead letter resolved", {observability::StringField("deadletter_id", deadletter_id),
                                             observability::StringField("workflow_id", entry->workflow_id)});
  return *entry;
}

std::optional<db::model::DeadLetterRecord> DeadLetterStore::Get(const std::string& deadletter_id) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetDeadLetter(*tx, deadletter_id);
  tx->Commit();
  return entry;
}

std::optional<db::model::DeadLetterRecord> DeadLetterStore::FindByWorkflow(const std::string& workflow_id) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetDeadLetterByWorkflow(*tx, workflow_id);
  tx->Commit();
  return entry;
}

std::vector<db::model::DeadLetterRecord> DeadLetterStore::List(bool unresolved_only) {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListDeadLetters(*tx);
  tx->Commit();

  if (!unresolved_only) return entries;

  std::vector<db::model::DeadLetterRecord> unresolved;
  for (auto& entry : entries) {
    if (IsUnresolved(entry)) unresolved.push_back(std::move(entry));
  }
  return unresolved;
}

} // namespace workflow::deadletter
