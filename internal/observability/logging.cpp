#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef WORKFLOW_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace workflow::observability {
namespace {

using workflow::runtime::config::RuntimeConfig;

constexpr const char* kLoggerName  = "workflow-manager";
constexpr const char* kTextPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr const char* kJsonPattern = R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l",%v})";

enum class Format {
  kText,
  kJson,
};

struct Settings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern{kTextPattern};
  Format                    format                = Format::kText;
  bool                      include_trace_context = false;
};

std::atomic<Format> g_format{Format::kText};
std::atomic<bool>   g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

spdlog::level::level_enum ParseLevel(const std::string& text) {
  auto level = spdlog::level::from_str(text);
  // from_str answers off for names it does not know.
  if (level == spdlog::level::off && text != "off") {
    return spdlog::level::info;
  }
  return level;
}

Settings Resolve(const RuntimeConfig& config) {
  const auto& logging = config.logging();
  Settings    settings;

  if (const char* level = Env("WORKFLOW_LOG_LEVEL")) {
    settings.level = ParseLevel(level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  if (const char* format = Env("WORKFLOW_LOG_FORMAT")) {
    settings.format = std::string(format) == "json" ? Format::kJson : Format::kText;
  } else if (logging.format() == workflow::runtime::config::LOG_FORMAT_JSON) {
    settings.format = Format::kJson;
  }

  if (settings.format == Format::kJson) {
    settings.pattern = kJsonPattern;
  } else if (const char* pattern = Env("WORKFLOW_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (const char* include_trace = Env("WORKFLOW_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

#ifdef WORKFLOW_ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::vector<LogField> TraceContextFields() {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return {{"trace_id", HexId(trace_bytes, 16)}, {"span_id", HexId(span_bytes, 8)}};
}
#else
std::vector<LogField> TraceContextFields() {
  return {};
}
#endif

// Values with whitespace, quotes or '=' are quoted so lines stay splittable.
void AppendTextField(std::string& out, const LogField& field) {
  out += field.key;
  out += '=';
  if (!field.value.empty() && field.value.find_first_of(" \t\n\"=") == std::string::npos) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c == '\n' ? ' ' : c;
  }
  out += '"';
}

std::string RenderText(std::string_view message, std::initializer_list<LogField> fields, const std::vector<LogField>& trace) {
  std::string out(message);
  for (const auto& field : fields) {
    out += ' ';
    AppendTextField(out, field);
  }
  for (const auto& field : trace) {
    out += ' ';
    AppendTextField(out, field);
  }
  return out;
}

// Object members without the surrounding braces; the pattern adds time and level.
std::string RenderJson(std::string_view message, std::initializer_list<LogField> fields, const std::vector<LogField>& trace) {
  google::protobuf::Struct object;
  auto&                    members = *object.mutable_fields();
  members["message"].set_string_value(std::string(message));
  for (const auto& field : fields) members[field.key].set_string_value(field.value);
  for (const auto& field : trace) members[field.key].set_string_value(field.value);

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(object, &json).ok() || json.size() < 2) {
    return R"("message":"unprintable log record")";
  }
  return json.substr(1, json.size() - 2);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField StateField(std::string_view key, model::WorkflowState state) {
  return {std::string(key), std::string(model::ToString(state))};
}

void InitializeLogging(const RuntimeConfig& config) {
  const auto settings = Resolve(config);

  // Re-initialisation (tests, workflowctl subcommands) replaces the logger.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_format.store(settings.format, std::memory_order_relaxed);
  g_include_trace_context.store(settings.include_trace_context, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  const auto trace = TraceContextFields();
  if (g_format.load(std::memory_order_relaxed) == Format::kJson) {
    spdlog::log(level, "{}", RenderJson(message, fields, trace));
    return;
  }
  spdlog::log(level, "{}", RenderText(message, fields, trace));
}

} // namespace workflow::observability
