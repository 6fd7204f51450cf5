#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/structured_payload.hpp"
#include "internal/util/time.hpp"

namespace workflow::events {

/*
  EventEmitter

  Appends domain events and metric samples inside the caller's
  transaction, so they commit or roll back with the state change that
  produced them. Consumers poll Unprocessed() and acknowledge with
  MarkProcessed().
*/
class EventEmitter {
 public:
  EventEmitter(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock);

  // Returns the stored event (id and sequence assigned).
  db::model::EventRecord Emit(db::Transaction& tx, const std::string& workflow_id, const model::StructuredPayload& payload);
  db::model::EventRecord Emit(db::Transaction& tx, const std::string& workflow_id, std::string_view event_type, const model::Attributes& data);

  void RecordMetric(db::Transaction& tx, const std::optional<std::string>& workflow_id, std::string_view metric_type, std::string_view metric_name,
                    double value, const model::Attributes& metadata = {});

  // Own transaction each.
  std::vector<db::model::EventRecord> Unprocessed(std::size_t limit = 0);
  void                                MarkProcessed(const std::string& event_id);
  std::vector<db::model::EventRecord> ForWorkflow(const std::string& workflow_id);

 private:
  db::model::EventRecord Append(db::Transaction& tx, const std::string& workflow_id, std::string_view event_type, std::string event_data);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace workflow::events
