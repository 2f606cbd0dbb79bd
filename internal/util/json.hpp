#pragma once

#include <google/protobuf/struct.pb.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace offline::util {

/*
  JSON codec for opaque payloads and cached values.

  Values are google.protobuf.Value trees. Anything plain JSON cannot carry
  (unset kinds, NaN/Inf, nesting beyond kMaxJsonDepth) is rejected with
  SerializationError before it reaches storage.
*/

constexpr int kMaxJsonDepth = 64;

std::string            ToJson(const google::protobuf::Value& value);
google::protobuf::Value FromJson(std::string_view json);

// Deep structural equality.
bool Equal(const google::protobuf::Value& a, const google::protobuf::Value& b);

// Null or unset.
bool IsNull(const google::protobuf::Value& value);

// Field lookup on a struct value; nullopt for missing fields and non-structs.
std::optional<google::protobuf::Value> Field(const google::protobuf::Value& value, const std::string& name);

// Builders for callers that assemble payloads in code.
google::protobuf::Value NullValue();
google::protobuf::Value StringValue(std::string_view s);
google::protobuf::Value NumberValue(double d);
google::protobuf::Value BoolValue(bool b);
google::protobuf::Value StructValue(std::initializer_list<std::pair<std::string, google::protobuf::Value>> fields);
google::protobuf::Value ListValue(const std::vector<google::protobuf::Value>& items);

} // namespace offline::util
