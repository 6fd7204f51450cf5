#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace workflow::db::model {

/*
  Durable metric sample.

  metric_type is one of "state_duration", "stage_duration", "error".
  Samples not tied to an item carry no workflow_id.
*/
struct MetricRecord {
  std::string                metric_id;
  std::optional<std::string> workflow_id;

  std::string metric_type;
  std::string metric_name;
  double      metric_value = 0.0;
  std::string metadata     = "{}";

  uint64_t created_at_ms = 0;
};

} // namespace workflow::db::model
