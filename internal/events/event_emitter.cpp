#include "event_emitter.hpp"

#include <stdexcept>

#include "internal/model/payload_codec.hpp"
#include "internal/util/uuid.hpp"

namespace workflow::events {

EventEmitter::EventEmitter(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

db::model::EventRecord EventEmitter::Append(db::Transaction& tx, const std::string& workflow_id, std::string_view event_type,
                                            std::string event_data) {
  db::model::EventRecord event;
  event.event_id      = util::NewId();
  event.workflow_id   = workflow_id;
  event.event_type    = std::string(event_type);
  event.event_data    = std::move(event_data);
  event.processed     = false;
  event.created_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->InsertEvent(tx, event), "emit event");
  return event;
}

db::model::EventRecord EventEmitter::Emit(db::Transaction& tx, const std::string& workflow_id, const model::StructuredPayload& payload) {
  return Append(tx, workflow_id, model::EventTypeOf(payload), model::EncodeJson(payload));
}

db::model::EventRecord EventEmitter::Emit(db::Transaction& tx, const std::string& workflow_id, std::string_view event_type,
                                          const model::Attributes& data) {
  if (event_type.empty()) throw std::invalid_argument("emit event: event type must not be empty");
  return Append(tx, workflow_id, event_type, model::EncodeAttributes(data));
}

void EventEmitter::RecordMetric(db::Transaction& tx, const std::optional<std::string>& workflow_id, std::string_view metric_type,
                                std::string_view metric_name, double value, const model::Attributes& metadata) {
  db::model::MetricRecord metric;
  metric.metric_id     = util::NewId();
  metric.workflow_id   = workflow_id;
  metric.metric_type   = std::string(metric_type);
  metric.metric_name   = std::string(metric_name);
  metric.metric_value  = value;
  metric.metadata      = model::EncodeAttributes(metadata);
  metric.created_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->InsertMetric(tx, metric), "record metric");
}

std::vector<db::model::EventRecord> EventEmitter::Unprocessed(std::size_t limit) {
  auto tx     = repository_->Begin();
  auto events = repository_->ListUnprocessedEvents(*tx, limit);
  tx->Commit();
  return events;
}

void EventEmitter::MarkProcessed(const std::string& event_id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->MarkEventProcessed(*tx, event_id), "mark event processed");
  tx->Commit();
}

std::vector<db::model::EventRecord> EventEmitter::ForWorkflow(const std::string& workflow_id) {
  auto tx     = repository_->Begin();
  auto events = repository_->ListEvents(*tx, workflow_id);
  tx->Commit();
  return events;
}

} // namespace workflow::events
