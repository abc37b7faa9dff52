#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>

namespace draft::model {

/*
  Form field values.

  A field map is a google.protobuf.Struct so values keep their JSON type
  (text fields are strings, checkboxes are bools, numeric fields numbers).
  Persisted as JSON text.
*/
using FieldValue  = google::protobuf::Value;
using FieldValues = google::protobuf::Struct;

FieldValue StringValue(std::string_view text);
FieldValue BoolValue(bool flag);
FieldValue NumberValue(double number);
FieldValue NullValue();

// Typed equality: "1" and 1 differ, two structs compare field by field.
bool ValueEquals(const FieldValue& lhs, const FieldValue& rhs);

std::optional<FieldValue> Lookup(const FieldValues& values, const std::string& field_name);

std::string ToJson(const FieldValues& values);
std::string ToJson(const FieldValue& value);

// Throw std::runtime_error on malformed input.
FieldValues FieldValuesFromJson(const std::string& json);
FieldValue  FieldValueFromJson(const std::string& json);

} // namespace draft::model
