#pragma once

#include <cstdint>
#include <string>

namespace workflow::db::model {

// Domain event. Only `processed` changes after insert.
struct EventRecord {
  std::string event_id;
  std::string workflow_id;
  std::string event_type;
  std::string event_data = "{}";
  bool        processed  = false;

  uint64_t created_at_ms = 0;
  uint64_t sequence      = 0;
};

} // namespace workflow::db::model
