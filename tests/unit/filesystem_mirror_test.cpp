#include "internal/storage/filesystem_mirror.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/buffer.hpp"
#include "internal/util/errors.hpp"

namespace {

using draft::storage::FilesystemMirror;
using draft::util::BufferFromString;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto root = std::filesystem::temp_directory_path() / "draft_manager_mirror_tests" / (test_name + "_" + std::to_string(stamp));
  std::filesystem::remove_all(root);
  return root;
}

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
}

FilesystemMirror MakeMirror(const std::filesystem::path& root) {
  return FilesystemMirror(std::make_shared<arrow::fs::LocalFileSystem>(), root);
}

void TestEnsureDirsCreatesBothSubtrees() {
  const auto root   = FreshRoot("ensure_dirs");
  auto       mirror = MakeMirror(root);

  mirror.EnsureDirs();
  mirror.EnsureDirs();

  assert(std::filesystem::is_directory(root / "blobs"));
  assert(std::filesystem::is_directory(root / "documents"));
}

void TestWriteReadActiveAndFinalized() {
  const auto root   = FreshRoot("write_read");
  auto       mirror = MakeMirror(root);
  mirror.EnsureDirs();

  mirror.WriteActive("doc-1", *BufferFromString("active bytes"));
  mirror.WriteFinalized("doc-1", *BufferFromString("final bytes"));

  assert(std::filesystem::exists(root / "blobs" / "doc-1.pdf"));
  assert(std::filesystem::exists(root / "documents" / "doc-1.pdf"));
  assert(!std::filesystem::exists(root / "blobs" / "doc-1.pdf.tmp"));

  assert(AsString(mirror.ReadActive("doc-1")) == "active bytes");
  assert(AsString(mirror.ReadFinalized("doc-1")) == "final bytes");

  // overwrite replaces the whole file
  mirror.WriteActive("doc-1", *BufferFromString("v2"));
  assert(AsString(mirror.ReadActive("doc-1")) == "v2");
}

void TestMissingFileIsAMiss() {
  const auto root   = FreshRoot("missing");
  auto       mirror = MakeMirror(root);
  mirror.EnsureDirs();

  assert(mirror.ReadActive("nope") == nullptr);
  assert(mirror.ReadFinalized("nope") == nullptr);
}

void TestDisabledMirrorIsNoop() {
  FilesystemMirror mirror(nullptr, FreshRoot("disabled"));
  assert(!mirror.Enabled());

  mirror.EnsureDirs();
  mirror.WriteActive("doc", *BufferFromString("x"));
  assert(mirror.ReadActive("doc") == nullptr);
  assert(!std::filesystem::exists(mirror.Root()));
}

void TestFailuresAreSwallowed() {
  const auto root = FreshRoot("unwritable");
  std::filesystem::create_directories(root.parent_path());

  // the root is a regular file, so nothing below it can be created
  std::ofstream(root) << "not a directory";

  auto mirror = MakeMirror(root);
  mirror.EnsureDirs();
  mirror.WriteActive("doc", *BufferFromString("x"));
  assert(mirror.ReadActive("doc") == nullptr);

  // ids that would escape the root are rejected and logged, not thrown
  auto ok = MakeMirror(FreshRoot("escape"));
  ok.EnsureDirs();
  ok.WriteActive("../escape", *BufferFromString("x"));
  assert(ok.ReadActive("../escape") == nullptr);
}

void TestResolveRootPrecedence() {
  assert(FilesystemMirror::ResolveRoot("/explicit/root", "app") == std::filesystem::path("/explicit/root"));

  setenv("DRAFT_DOCS_DIR", "/from/env", 1);
  assert(FilesystemMirror::ResolveRoot("", "app") == std::filesystem::path("/from/env"));
  unsetenv("DRAFT_DOCS_DIR");

  setenv("XDG_DATA_HOME", "/xdg", 1);
  assert(FilesystemMirror::ResolveRoot("", "") == std::filesystem::path("/xdg/draft-manager"));
  assert(FilesystemMirror::ResolveRoot("", "custom") == std::filesystem::path("/xdg/custom"));
  unsetenv("XDG_DATA_HOME");

  setenv("HOME", "/home/tester", 1);
  assert(FilesystemMirror::ResolveRoot("", "") == std::filesystem::path("/home/tester/.local/share/draft-manager"));
}

} // namespace

int main() {
  TestEnsureDirsCreatesBothSubtrees();
  TestWriteReadActiveAndFinalized();
  TestMissingFileIsAMiss();
  TestDisabledMirrorIsNoop();
  TestFailuresAreSwallowed();
  TestResolveRootPrecedence();

  std::cout << "draft_manager_unit_filesystem_mirror: pass\n";
  return 0;
}
