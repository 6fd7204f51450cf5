#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

#include "internal/model/structured_payload.hpp"

namespace workflow::model {

/*
  JSON codec for structured payloads.

  Everything goes through google::protobuf::Struct and protobuf's
  json_util so the stored text is plain JSON any backend (or a jsonb
  column) accepts. Integers survive as long as they fit a double
  mantissa, which covers millisecond timestamps and counters.

  Malformed input raises std::invalid_argument.
*/

std::string EncodeJson(const StructuredPayload& payload);
std::string EncodeAttributes(const Attributes& attributes);

// Top-level keys only; nested objects/arrays come back as JSON text.
Attributes DecodeAttributes(std::string_view json);

google::protobuf::Struct ParseObject(std::string_view json);
std::string              PrintObject(const google::protobuf::Struct& object);

bool IsJsonObject(std::string_view json);

google::protobuf::Value ToProtoValue(const Value& value);
Value                   FromProtoValue(const google::protobuf::Value& value);

} // namespace workflow::model
