#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <filesystem>
#include <memory>
#include <string>

namespace draft::storage {

/*
  Best-effort on-disk copy of draft payloads.

    {root}/blobs/{id}.pdf       latest saved payload of an active draft
    {root}/documents/{id}.pdf   finalized payload

  Writes go to "{path}.tmp" and are moved into place. No operation throws:
  failures are logged at WARN and reported as a miss / no-op. A null
  filesystem disables the mirror.
*/
class FilesystemMirror {
 public:
  FilesystemMirror(std::shared_ptr<arrow::fs::FileSystem> fs, std::filesystem::path root);

  // override (if non-empty) > DRAFT_DOCS_DIR > $XDG_DATA_HOME/<app> > $HOME/.local/share/<app>
  static std::filesystem::path ResolveRoot(const std::string& override_path, const std::string& app_name);

  bool Enabled() const {
    return fs_ != nullptr;
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

  void EnsureDirs();

  void WriteActive(const std::string& id, const arrow::Buffer& buffer);
  void WriteFinalized(const std::string& id, const arrow::Buffer& buffer);

  // nullptr when absent, unreadable or disabled.
  std::shared_ptr<arrow::Buffer> ReadActive(const std::string& id);
  std::shared_ptr<arrow::Buffer> ReadFinalized(const std::string& id);

 private:
  void                           Write(const std::filesystem::path& dir, const std::string& id, const arrow::Buffer& buffer);
  std::shared_ptr<arrow::Buffer> Read(const std::filesystem::path& dir, const std::string& id);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::filesystem::path                  root_;
  std::filesystem::path                  blobs_dir_;
  std::filesystem::path                  documents_dir_;
};

} // namespace draft::storage
