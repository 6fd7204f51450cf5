#include "payload_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace workflow::model {

namespace {

using google::protobuf::Struct;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void SetString(Struct& out, const std::string& key, std::string_view value) {
  (*out.mutable_fields())[key].set_string_value(std::string(value));
}

void SetNumber(Struct& out, const std::string& key, double value) {
  (*out.mutable_fields())[key].set_number_value(value);
}

void SetBool(Struct& out, const std::string& key, bool value) {
  (*out.mutable_fields())[key].set_bool_value(value);
}

Struct ToStruct(const Attributes& attributes) {
  Struct out;
  for (const auto& [key, value] : attributes) {
    (*out.mutable_fields())[key] = ToProtoValue(value);
  }
  return out;
}

Struct ToStruct(const StructuredPayload& payload) {
  return std::visit(Overloaded{
                        [](const Attributes& attributes) { return ToStruct(attributes); },
                        [](const StateChanged& changed) {
                          Struct out;
                          SetString(out, "transition_id", changed.transition_id);
                          SetString(out, "from_state", ToString(changed.from_state));
                          SetString(out, "to_state", ToString(changed.to_state));
                          SetString(out, "stage", changed.stage);
                          SetString(out, "reason", changed.reason);
                          return out;
                        },
                        [](const LeaseChanged& lease) {
                          Struct out;
                          SetString(out, "change", ToString(lease.change));
                          SetString(out, "worker_id", lease.worker_id);
                          if (!lease.previous_holder.empty()) SetString(out, "previous_holder", lease.previous_holder);
                          return out;
                        },
                        [](const RetryScheduled& retry) {
                          Struct out;
                          SetNumber(out, "retry_count", retry.retry_count);
                          SetNumber(out, "max_retries", retry.max_retries);
                          SetNumber(out, "delay_seconds", static_cast<double>(retry.delay_seconds));
                          SetNumber(out, "next_retry_at_ms", static_cast<double>(retry.next_retry_at_ms));
                          SetString(out, "error", retry.error);
                          return out;
                        },
                        [](const DeadLettered& dead) {
                          Struct out;
                          SetString(out, "deadletter_id", dead.deadletter_id);
                          SetNumber(out, "failure_count", dead.failure_count);
                          SetBool(out, "permanent", dead.permanent);
                          SetString(out, "error", dead.error);
                          return out;
                        },
                        [](const QuotaExhausted& quota) {
                          Struct out;
                          SetString(out, "service_name", quota.service_name);
                          auto* types = (*out.mutable_fields())["quota_types"].mutable_list_value();
                          for (const auto& type : quota.quota_types) {
                            types->add_values()->set_string_value(type);
                          }
                          SetNumber(out, "estimated_reset_ms", static_cast<double>(quota.estimated_reset_ms));
                          SetNumber(out, "wait_seconds", static_cast<double>(quota.wait_seconds));
                          return out;
                        },
                        [](const Enqueued& enqueued) {
                          Struct out;
                          SetNumber(out, "priority", enqueued.priority);
                          SetNumber(out, "max_retries", enqueued.max_retries);
                          return out;
                        },
                    },
                    payload);
}

} // namespace

google::protobuf::Value ToProtoValue(const Value& value) {
  google::protobuf::Value out;
  std::visit(Overloaded{
                 [&](std::monostate) { out.set_null_value(google::protobuf::NULL_VALUE); },
                 [&](bool v) { out.set_bool_value(v); },
                 [&](std::int64_t v) { out.set_number_value(static_cast<double>(v)); },
                 [&](double v) { out.set_number_value(v); },
                 [&](const std::string& v) { out.set_string_value(v); },
             },
             value);
  return out;
}

Value FromProtoValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      double       whole  = 0;
      if (std::modf(number, &whole) == 0.0 && std::fabs(number) < 9007199254740992.0) {
        return static_cast<std::int64_t>(number);
      }
      return number;
    }
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kStructValue:
      return PrintObject(value.struct_value());
    case google::protobuf::Value::kListValue: {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(value.list_value(), &json);
      if (!status.ok()) throw std::invalid_argument("failed to print list: " + std::string(status.message()));
      return json;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      return std::monostate{};
  }
}

google::protobuf::Struct ParseObject(std::string_view json) {
  Struct out;
  if (json.empty()) return out;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &out, options);
  if (!status.ok()) {
    throw std::invalid_argument("invalid JSON object: " + std::string(status.message()));
  }
  return out;
}

std::string PrintObject(const google::protobuf::Struct& object) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::invalid_argument("failed to print JSON object: " + std::string(status.message()));
  }
  return json;
}

bool IsJsonObject(std::string_view json) {
  Struct                                   out;
  google::protobuf::util::JsonParseOptions options;
  return google::protobuf::util::JsonStringToMessage(std::string(json), &out, options).ok();
}

std::string EncodeJson(const StructuredPayload& payload) {
  return PrintObject(ToStruct(payload));
}

std::string EncodeAttributes(const Attributes& attributes) {
  return PrintObject(ToStruct(attributes));
}

Attributes DecodeAttributes(std::string_view json) {
  Attributes   out;
  const Struct doc = ParseObject(json);
  for (const auto& [key, value] : doc.fields()) {
    out.emplace(key, FromProtoValue(value));
  }
  return out;
}

} // namespace workflow::model
