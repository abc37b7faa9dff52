#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "draft_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\drafts\\\"quoted\"\\db.sqlite"
mirror:
  root_path: "/tmp/drafts"
)");

  auto config = draft::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\drafts\\\"quoted\"\\db.sqlite");
  assert(config.mirror().root_path() == "/tmp/drafts");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  pattern: "line1\nline2☃"
)");

  auto config = draft::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(limits:
  max_versions_per_document: 5
  unknown_field: 123
)");

  bool threw = false;
  try {
    (void)draft::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNumericLimitsAndBooleans() {
  auto config = draft::config::ConfigLoader::LoadFromYamlString(R"(mirror:
  disabled: true
limits:
  cache_max_bytes: 1048576
  storage_soft_limit_bytes: 2097152
  max_versions_per_document: 3
  max_change_log_entries: 10
  cleanup_threshold_days: 7
updates:
  debounce_ms: 50
)");

  assert(config.mirror().disabled());
  assert(config.limits().cache_max_bytes() == 1048576);
  assert(config.limits().storage_soft_limit_bytes() == 2097152);
  assert(config.limits().max_versions_per_document() == 3);
  assert(config.limits().max_change_log_entries() == 10);
  assert(config.limits().cleanup_threshold_days() == 7);
  assert(config.updates().debounce_ms() == 50);

  const auto options = draft::factory::OptionsFromConfig(config);
  assert(options.storage_soft_limit_bytes == 2097152);
  assert(options.max_versions_per_document == 3);
  assert(options.max_change_log_entries == 10);
  assert(options.cleanup_threshold_days == 7);
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = draft::config::ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(config.limits().max_versions_per_document() == 0);

  const auto options = draft::factory::OptionsFromConfig(config);
  assert(options.storage_soft_limit_bytes == 100ULL * 1024 * 1024);
  assert(options.max_versions_per_document == 5);
  assert(options.max_change_log_entries == 100);
  assert(options.cleanup_threshold_days == 30);
}

void TestQuotedNumberStaysString() {
  auto config = draft::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "300"
)");
  assert(config.database().sqlite().path() == "300");
}

void TestNonMapTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)draft::config::ConfigLoader::LoadFromYamlString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestNumericLimitsAndBooleans();
  TestEmptyDocumentYieldsDefaults();
  TestQuotedNumberStaysString();
  TestNonMapTopLevelIsRejected();

  std::cout << "draft_manager_unit_config_loader: pass\n";
  return 0;
}
