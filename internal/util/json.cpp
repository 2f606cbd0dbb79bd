#include "json.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cmath>

#include "internal/util/errors.hpp"

namespace offline::util {

using google::protobuf::Value;

namespace {

void Validate(const Value& value, int depth, const std::string& path) {
  if (depth > kMaxJsonDepth) {
    throw SerializationError("value nesting exceeds " + std::to_string(kMaxJsonDepth) + " levels at " + path);
  }

  switch (value.kind_case()) {
    case Value::kNullValue:
    case Value::kStringValue:
    case Value::kBoolValue:
      return;

    case Value::kNumberValue:
      if (!std::isfinite(value.number_value())) {
        throw SerializationError("non-finite number at " + path);
      }
      return;

    case Value::kStructValue:
      for (const auto& [key, field] : value.struct_value().fields()) {
        Validate(field, depth + 1, path + "." + key);
      }
      return;

    case Value::kListValue: {
      const auto& values = value.list_value().values();
      for (int i = 0; i < values.size(); ++i) {
        Validate(values.Get(i), depth + 1, path + "[" + std::to_string(i) + "]");
      }
      return;
    }

    case Value::KIND_NOT_SET:
    default:
      throw SerializationError("value has no kind at " + path);
  }
}

} // namespace

std::string ToJson(const Value& value) {
  Validate(value, 0, "$");

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw SerializationError("Failed to serialize value to JSON: " + std::string(status.message()));
  }
  return json;
}

Value FromJson(std::string_view json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(
      google::protobuf::StringPiece(json.data(), json.size()), &value);
  if (!status.ok()) {
    throw SerializationError("Failed to parse JSON value: " + std::string(status.message()));
  }
  return value;
}

bool Equal(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

bool IsNull(const Value& value) {
  return value.kind_case() == Value::KIND_NOT_SET || value.kind_case() == Value::kNullValue;
}

std::optional<Value> Field(const Value& value, const std::string& name) {
  if (value.kind_case() != Value::kStructValue) {
    return std::nullopt;
  }

  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(name);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return it->second;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value StringValue(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value NumberValue(double d) {
  Value v;
  v.set_number_value(d);
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value StructValue(std::initializer_list<std::pair<std::string, Value>> fields) {
  Value v;
  auto* out = v.mutable_struct_value()->mutable_fields();
  for (const auto& [key, field] : fields) {
    (*out)[key] = field;
  }
  return v;
}

Value ListValue(const std::vector<Value>& items) {
  Value v;
  auto* out = v.mutable_list_value();
  for (const auto& item : items) {
    *out->add_values() = item;
  }
  return v;
}

} // namespace offline::util
