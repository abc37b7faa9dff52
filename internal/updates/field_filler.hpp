#pragma once

#include <arrow/buffer.h>

#include <memory>

#include "internal/model/field_values.hpp"

namespace draft::updates {

/*
  Regenerates a document with new form field values.

  The PDF form library lives outside this project; it plugs in here.
  Implementations must not retain or mutate `source`.
*/
class FieldFiller {
 public:
  virtual ~FieldFiller() = default;

  virtual std::shared_ptr<arrow::Buffer> Fill(const arrow::Buffer& source, const model::FieldValues& values) = 0;
};

} // namespace draft::updates
