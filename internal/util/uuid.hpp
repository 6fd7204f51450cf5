#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace workflow::util {

/*
  UUID helpers

  Workflow, transition, event and dead-letter ids are RFC4122 v4 UUIDs
  stored in their canonical text form (8-4-4-4-12, lower-case hex).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical form only; either hex case is accepted.
std::optional<UUID> ParseUUID(std::string_view text);

inline bool IsValidId(std::string_view text) {
  return ParseUUID(text).has_value();
}

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace workflow::util
