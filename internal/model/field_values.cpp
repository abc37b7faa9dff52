#include "field_values.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stdexcept>

namespace draft::model {

namespace {

template <typename Message>
std::string PrintJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("field values: json encode failed: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message ParseJson(const std::string& json) {
  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("field values: json decode failed: " + std::string(status.message()));
  }
  return message;
}

} // namespace

FieldValue StringValue(std::string_view text) {
  FieldValue value;
  value.set_string_value(std::string(text));
  return value;
}

FieldValue BoolValue(bool flag) {
  FieldValue value;
  value.set_bool_value(flag);
  return value;
}

FieldValue NumberValue(double number) {
  FieldValue value;
  value.set_number_value(number);
  return value;
}

FieldValue NullValue() {
  FieldValue value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

bool ValueEquals(const FieldValue& lhs, const FieldValue& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

std::optional<FieldValue> Lookup(const FieldValues& values, const std::string& field_name) {
  const auto it = values.fields().find(field_name);
  if (it == values.fields().end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ToJson(const FieldValues& values) {
  return PrintJson(values);
}

std::string ToJson(const FieldValue& value) {
  return PrintJson(value);
}

FieldValues FieldValuesFromJson(const std::string& json) {
  if (json.empty()) {
    return {};
  }
  return ParseJson<FieldValues>(json);
}

FieldValue FieldValueFromJson(const std::string& json) {
  return ParseJson<FieldValue>(json);
}

} // namespace draft::model
