#include "internal/changelog/change_logger.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using draft::changelog::ChangeLogger;
using draft::db::memory::MemoryRepository;
using draft::model::FieldValues;
using draft::model::NumberValue;
using draft::model::StringValue;

FieldValues Values(std::initializer_list<std::pair<std::string, draft::model::FieldValue>> entries) {
  FieldValues values;
  for (const auto& [name, value] : entries) {
    (*values.mutable_fields())[name] = value;
  }
  return values;
}

void TestOnlyChangedOrNewFieldsAreLogged() {
  auto         repo = std::make_shared<MemoryRepository>();
  ChangeLogger changes(repo);

  auto tx = repo->Begin();
  const auto written = changes.LogChanges(*tx, "doc", Values({{"a", StringValue("1")}, {"b", StringValue("x")}}),
                                          Values({{"a", StringValue("1")}, {"b", StringValue("y")}, {"c", StringValue("new")}}), 100);
  tx->Commit();

  assert(written == 2);

  auto read    = repo->Begin();
  auto entries = changes.ListChanges(*read, "doc", 50);
  assert(entries.size() == 2);

  // same timestamp: newest insertion first, inserted in field-name order
  assert(entries[0].field_name == "c");
  assert(!entries[0].old_value.has_value());
  assert(entries[0].new_value.string_value() == "new");

  assert(entries[1].field_name == "b");
  assert(entries[1].old_value.has_value());
  assert(entries[1].old_value->string_value() == "x");
  assert(entries[1].new_value.string_value() == "y");
  assert(entries[1].id == "doc_b_100_" + std::to_string(entries[1].sequence));
}

void TestTypeChangeCountsAsChange() {
  auto         repo = std::make_shared<MemoryRepository>();
  ChangeLogger changes(repo);

  auto tx = repo->Begin();
  const auto retyped = changes.LogChanges(*tx, "doc", Values({{"n", StringValue("1")}}), Values({{"n", NumberValue(1)}}), 1);
  const auto same    = changes.LogChanges(*tx, "doc", Values({{"n", NumberValue(1)}}), Values({{"n", NumberValue(1)}}), 2);
  assert(retyped == 1);
  assert(same == 0);
  tx->Commit();
}

void TestRemovedFieldsAreNotLogged() {
  auto         repo = std::make_shared<MemoryRepository>();
  ChangeLogger changes(repo);

  auto tx = repo->Begin();
  const auto written = changes.LogChanges(*tx, "doc", Values({{"gone", StringValue("x")}}), FieldValues{}, 1);
  assert(written == 0);
  tx->Commit();
}

void TestListNewestFirstWithLimit() {
  auto         repo = std::make_shared<MemoryRepository>();
  ChangeLogger changes(repo);

  auto tx = repo->Begin();
  for (int i = 1; i <= 5; ++i) {
    changes.LogChanges(*tx, "doc", FieldValues{}, Values({{"f", NumberValue(i)}}), static_cast<uint64_t>(i * 10));
  }
  tx->Commit();

  auto read   = repo->Begin();
  auto latest = changes.ListChanges(*read, "doc", 2);
  assert(latest.size() == 2);
  assert(latest[0].timestamp_ms == 50);
  assert(latest[0].new_value.number_value() == 5);
  assert(latest[1].timestamp_ms == 40);
}

void TestTrimKeepsNewestEntries() {
  auto         repo = std::make_shared<MemoryRepository>();
  ChangeLogger changes(repo, 3);

  auto tx = repo->Begin();
  for (int i = 1; i <= 6; ++i) {
    changes.LogChanges(*tx, "doc", FieldValues{}, Values({{"f", NumberValue(i)}}), static_cast<uint64_t>(i));
  }
  changes.LogChanges(*tx, "other", FieldValues{}, Values({{"f", NumberValue(1)}}), 1);
  tx->Commit();

  auto read    = repo->Begin();
  auto entries = changes.ListChanges(*read, "doc", 50);
  assert(entries.size() == 3);
  assert(entries[0].timestamp_ms == 6);
  assert(entries[2].timestamp_ms == 4);
  assert(changes.ListChanges(*read, "other", 50).size() == 1);
  read->Rollback();

  auto del = repo->Begin();
  const auto deleted = changes.DeleteAll(*del, "doc");
  assert(deleted == 3);
  del->Commit();
}

} // namespace

int main() {
  TestOnlyChangedOrNewFieldsAreLogged();
  TestTypeChangeCountsAsChange();
  TestRemovedFieldsAreNotLogged();
  TestListNewestFirstWithLimit();
  TestTrimKeepsNewestEntries();

  std::cout << "draft_manager_unit_change_logger: pass\n";
  return 0;
}
