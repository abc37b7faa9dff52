#include "change_logger.hpp"

#include <map>

#include "internal/observability/logging.hpp"

namespace draft::changelog {

using observability::StringField;
using observability::UintField;

ChangeLogger::ChangeLogger(std::shared_ptr<db::Repository> repository, uint32_t max_entries)
    : repository_(std::move(repository)), max_entries_(max_entries == 0 ? kDefaultMaxEntries : max_entries) {
}

std::size_t ChangeLogger::LogChanges(db::Transaction& tx, const std::string& document_id, const model::FieldValues& old_values,
                                     const model::FieldValues& new_values, uint64_t now_ms) {
  // protobuf map iteration order is unspecified; log in field-name order
  std::map<std::string, model::FieldValue> ordered;
  for (const auto& [field_name, value] : new_values.fields()) {
    ordered.emplace(field_name, value);
  }

  std::size_t written = 0;
  for (const auto& [field_name, new_value] : ordered) {
    auto old_value = model::Lookup(old_values, field_name);
    if (old_value && model::ValueEquals(*old_value, new_value)) continue;

    db::model::ChangeLogRecord record;
    record.document_id  = document_id;
    record.field_name   = field_name;
    record.old_value    = std::move(old_value);
    record.new_value    = new_value;
    record.timestamp_ms = now_ms;

    db::ThrowIfError(repository_->InsertChange(tx, record), "log change " + document_id + "." + field_name);
    ++written;
  }

  if (written > 0) {
    Trim(tx, document_id);
  }
  return written;
}

std::vector<db::model::ChangeLogRecord> ChangeLogger::ListChanges(db::Transaction& tx, const std::string& document_id, std::size_t limit) {
  auto changes = repository_->ListChangesByDocument(tx, document_id);
  if (changes.size() > limit) changes.resize(limit);
  return changes;
}

std::size_t ChangeLogger::Trim(db::Transaction& tx, const std::string& document_id) {
  const auto  changes = repository_->ListChangesByDocument(tx, document_id);
  std::size_t trimmed = 0;

  for (std::size_t i = max_entries_; i < changes.size(); ++i) {
    db::ThrowIfError(repository_->DeleteChange(tx, changes[i].id), "trim change " + changes[i].id);
    ++trimmed;
  }

  if (trimmed > 0) {
    DRAFT_LOG_DEBUG("change log trimmed", {StringField("document_id", document_id), UintField("count", trimmed)});
  }
  return trimmed;
}

std::size_t ChangeLogger::DeleteAll(db::Transaction& tx, const std::string& document_id) {
  const auto changes = repository_->ListChangesByDocument(tx, document_id);
  for (const auto& change : changes) {
    db::ThrowIfError(repository_->DeleteChange(tx, change.id), "delete change " + change.id);
  }
  return changes.size();
}

} // namespace draft::changelog
