#include "filesystem_mirror.hpp"

#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/buffer.hpp"

namespace draft::storage {

using namespace draft::storage::common;
using observability::StringField;

namespace {

constexpr const char* kDefaultAppName = "draft-manager";
constexpr const char* kBlobsDir       = "blobs";
constexpr const char* kDocumentsDir   = "documents";

std::string FsPath(const std::filesystem::path& path) {
  return path.generic_string();
}

} // namespace

FilesystemMirror::FilesystemMirror(std::shared_ptr<arrow::fs::FileSystem> fs, std::filesystem::path root)
    : fs_(std::move(fs)), root_(std::move(root)), blobs_dir_(root_ / kBlobsDir), documents_dir_(root_ / kDocumentsDir) {
}

std::filesystem::path FilesystemMirror::ResolveRoot(const std::string& override_path, const std::string& app_name) {
  const std::string app = app_name.empty() ? kDefaultAppName : app_name;

  std::filesystem::path root;
  if (!override_path.empty()) {
    root = override_path;
  } else if (const char* docs_dir = std::getenv("DRAFT_DOCS_DIR"); docs_dir && *docs_dir) {
    root = docs_dir;
  } else if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    root = std::filesystem::path(xdg) / app;
  } else if (const char* home = std::getenv("HOME"); home && *home) {
    root = std::filesystem::path(home) / ".local" / "share" / app;
  } else {
    root = std::filesystem::temp_directory_path() / app;
  }

  return std::filesystem::absolute(root).lexically_normal();
}

void FilesystemMirror::EnsureDirs() {
  if (!fs_) return;

  for (const auto& dir : {blobs_dir_, documents_dir_}) {
    try {
      auto info = Unwrap(fs_->GetFileInfo(FsPath(dir)));
      if (info.type() == arrow::fs::FileType::Directory) continue;
      Unwrap(fs_->CreateDir(FsPath(dir), /*recursive=*/true));
    } catch (const std::exception& e) {
      DRAFT_LOG_WARN("mirror create dir failed", {StringField("path", FsPath(dir)), StringField("error", e.what())});
    }
  }
}

void FilesystemMirror::WriteActive(const std::string& id, const arrow::Buffer& buffer) {
  Write(blobs_dir_, id, buffer);
}

void FilesystemMirror::WriteFinalized(const std::string& id, const arrow::Buffer& buffer) {
  Write(documents_dir_, id, buffer);
}

std::shared_ptr<arrow::Buffer> FilesystemMirror::ReadActive(const std::string& id) {
  return Read(blobs_dir_, id);
}

std::shared_ptr<arrow::Buffer> FilesystemMirror::ReadFinalized(const std::string& id) {
  return Read(documents_dir_, id);
}

/*
  Atomic write:
      write tmp → close → move
*/
void FilesystemMirror::Write(const std::filesystem::path& dir, const std::string& id, const arrow::Buffer& buffer) {
  if (!fs_) return;

  try {
    const auto final_path = FsPath(DocumentPath(dir, id));
    const auto tmp_path   = final_path + ".tmp";

    {
      auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
      Unwrap(out->Write(buffer.data(), buffer.size()));
      Unwrap(out->Close());
    }

    Unwrap(fs_->Move(tmp_path, final_path));
  } catch (const std::exception& e) {
    DRAFT_LOG_WARN("mirror write failed", {StringField("dir", FsPath(dir)), StringField("document_id", id), StringField("error", e.what())});
  }
}

std::shared_ptr<arrow::Buffer> FilesystemMirror::Read(const std::filesystem::path& dir, const std::string& id) {
  if (!fs_) return nullptr;

  try {
    const auto path = FsPath(DocumentPath(dir, id));

    auto info = Unwrap(fs_->GetFileInfo(path));
    if (info.type() != arrow::fs::FileType::File) return nullptr;

    auto file = Unwrap(fs_->OpenInputFile(path));
    auto data = ReadAll(file);
    Unwrap(file->Close());

    // detach from any memory-mapped or pooled storage owned by the file
    return util::CopyBuffer(*data);
  } catch (const std::exception& e) {
    DRAFT_LOG_WARN("mirror read failed", {StringField("dir", FsPath(dir)), StringField("document_id", id), StringField("error", e.what())});
    return nullptr;
  }
}

} // namespace draft::storage
