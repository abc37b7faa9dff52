#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/field_values.hpp"

namespace draft::db::model {

/*
  One field transition between two saves (collection "change_log").

  old_value is empty when the field did not exist before.
  sequence is assigned by the repository on insert and orders entries
  that share a timestamp.
*/
struct ChangeLogRecord {
  std::string id;
  std::string document_id;
  std::string field_name;

  std::optional<draft::model::FieldValue> old_value;
  draft::model::FieldValue                new_value;

  uint64_t timestamp_ms = 0;
  uint64_t sequence     = 0;
};

} // namespace draft::db::model
