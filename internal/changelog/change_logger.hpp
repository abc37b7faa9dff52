#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace draft::changelog {

/*
  Per-field change history.

  One entry for every field of the new value set that is absent from, or
  different to, the old value set. Fields removed by an update are not
  recorded.
*/
class ChangeLogger {
 public:
  static constexpr uint32_t kDefaultMaxEntries = 100;

  ChangeLogger(std::shared_ptr<db::Repository> repository, uint32_t max_entries = kDefaultMaxEntries);

  // Returns the number of entries written.
  std::size_t LogChanges(db::Transaction& tx, const std::string& document_id, const model::FieldValues& old_values,
                         const model::FieldValues& new_values, uint64_t now_ms);

  // Newest first.
  std::vector<db::model::ChangeLogRecord> ListChanges(db::Transaction& tx, const std::string& document_id, std::size_t limit);

  // Keeps the newest max_entries rows.
  std::size_t Trim(db::Transaction& tx, const std::string& document_id);

  std::size_t DeleteAll(db::Transaction& tx, const std::string& document_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_entries_;
};

} // namespace draft::changelog
