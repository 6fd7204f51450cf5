#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/structured_payload.hpp"
#include "internal/util/time.hpp"

namespace workflow::deadletter {

/*
  DeadLetterStore

  One entry per workflow. Recording again for the same workflow bumps
  failure_count and overwrites the error columns and the item
  snapshot. Resolution is bookkeeping only; it never re-enqueues.

  An entry is unresolved while resolved_at is unset or older than the
  latest failure.
*/
class DeadLetterStore {
 public:
  DeadLetterStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock);

  db::model::DeadLetterRecord Record(db::Transaction& tx, const std::string& workflow_id, const std::string& original_data,
                                     const std::string& error_message, const model::Attributes& error_details = {});
  db::model::DeadLetterRecord Record(const std::string& workflow_id, const std::string& original_data, const std::string& error_message,
                                     const model::Attributes& error_details = {});

  // Throws util::NotFound for an unknown id.
  db::model::DeadLetterRecord Resolve(const std::string& deadletter_id, const std::string& notes);

  std::optional<db::model::DeadLetterRecord> Get(const std::string& deadletter_id);
  std::optional<db::model::DeadLetterRecord> FindByWorkflow(const std::string& workflow_id);
  std::vector<db::model::DeadLetterRecord>   List(bool unresolved_only);

  static bool IsUnresolved(const db::model::DeadLetterRecord& record);

  // JSON snapshot of an item for original_data.
  static std::string Snapshot(const db::model::WorkflowRecord& record);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace workflow::deadletter
