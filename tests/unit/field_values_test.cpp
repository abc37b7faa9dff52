#include "internal/model/field_values.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/draft_status.hpp"
#include "internal/util/buffer.hpp"

namespace {

using namespace draft::model;

void TestTypedEquality() {
  assert(ValueEquals(StringValue("1"), StringValue("1")));
  assert(!ValueEquals(StringValue("1"), NumberValue(1)));
  assert(!ValueEquals(BoolValue(true), StringValue("true")));
  assert(ValueEquals(NullValue(), NullValue()));
}

void TestJsonPreservesTypes() {
  FieldValues values;
  (*values.mutable_fields())["name"]     = StringValue("Ada");
  (*values.mutable_fields())["financed"] = BoolValue(true);
  (*values.mutable_fields())["price"]    = NumberValue(19999.5);
  (*values.mutable_fields())["notes"]    = NullValue();

  const auto decoded = FieldValuesFromJson(ToJson(values));
  assert(decoded.fields_size() == 4);
  assert(decoded.fields().at("name").string_value() == "Ada");
  assert(decoded.fields().at("financed").bool_value());
  assert(decoded.fields().at("price").number_value() == 19999.5);
  assert(decoded.fields().at("notes").kind_case() == FieldValue::kNullValue);

  assert(ToJson(StringValue("x")) == "\"x\"");
  assert(ValueEquals(FieldValueFromJson("true"), BoolValue(true)));
}

void TestEmptyAndMalformedJson() {
  assert(FieldValuesFromJson("").fields_size() == 0);

  bool threw = false;
  try {
    (void)FieldValuesFromJson("{not json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestLookup() {
  FieldValues values;
  (*values.mutable_fields())["vin"] = StringValue("123");

  assert(Lookup(values, "vin").has_value());
  assert(Lookup(values, "vin")->string_value() == "123");
  assert(!Lookup(values, "missing").has_value());
}

void TestStatusTransitions() {
  assert(CanTransition(DraftStatus::kDraft, DraftStatus::kFinalizing));
  assert(CanTransition(DraftStatus::kDraft, DraftStatus::kFinalized));
  assert(CanTransition(DraftStatus::kFinalizing, DraftStatus::kFinalized));
  assert(CanTransition(DraftStatus::kFinalized, DraftStatus::kFinalized));

  assert(!CanTransition(DraftStatus::kFinalized, DraftStatus::kDraft));
  assert(!CanTransition(DraftStatus::kFinalized, DraftStatus::kFinalizing));
  assert(!CanTransition(DraftStatus::kFinalizing, DraftStatus::kDraft));

  assert(!IsTerminal(DraftStatus::kFinalizing));
  assert(IsTerminal(DraftStatus::kFinalized));
  assert(!StatusFromInt(0).has_value());
  assert(StatusFromInt(2) == DraftStatus::kFinalizing);
}

void TestPdfValidationAndChecksum() {
  assert(!draft::util::IsValidPdfBuffer(nullptr));
  assert(!draft::util::IsValidPdfBuffer(draft::util::BufferFromString("%PDF-1.7")));
  assert(draft::util::IsValidPdfBuffer(draft::util::BufferFromString("%PDF-1.7\n" + std::string(40, 'x'))));
  assert(!draft::util::IsValidPdfBuffer(draft::util::BufferFromString(std::string(40, 'x'))));

  const auto a = draft::util::Checksum(*draft::util::BufferFromString("abc"));
  const auto b = draft::util::Checksum(*draft::util::BufferFromString("abd"));
  assert(a.size() == 16);
  assert(a != b);
  // FNV-1a 64 of the empty input is the offset basis
  assert(draft::util::Checksum(*draft::util::BufferFromString("")) == "cbf29ce484222325");
}

} // namespace

int main() {
  TestTypedEquality();
  TestJsonPreservesTypes();
  TestEmptyAndMalformedJson();
  TestLookup();
  TestStatusTransitions();
  TestPdfValidationAndChecksum();

  std::cout << "draft_manager_unit_field_values: pass\n";
  return 0;
}
