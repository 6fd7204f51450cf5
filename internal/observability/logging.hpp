#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/workflow_state.hpp"

namespace workflow::runtime::config {
class RuntimeConfig;
}

namespace workflow::observability {

/*
  Structured logging on spdlog.

  One logger ("workflow-manager") writing to stderr. Fields render as
  key=value pairs in text format or as members of a one-line JSON
  object in json format. Until InitializeLogging runs, spdlog's default
  logger is used.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField StateField(std::string_view key, model::WorkflowState state);

void InitializeLogging(const workflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace workflow::observability

#define WORKFLOW_LOG_DEBUG(message, ...) ::workflow::observability::LogDebug((message), ##__VA_ARGS__)
#define WORKFLOW_LOG_INFO(message, ...) ::workflow::observability::LogInfo((message), ##__VA_ARGS__)
#define WORKFLOW_LOG_WARN(message, ...) ::workflow::observability::LogWarn((message), ##__VA_ARGS__)
#define WORKFLOW_LOG_ERROR(message, ...) ::workflow::observability::LogError((message), ##__VA_ARGS__)
