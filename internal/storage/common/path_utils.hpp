#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace draft::storage::common {

/*
  Draft ids double as file names under the mirror root, so anything that
  could escape the directory is rejected.
*/
inline void ValidateDocumentId(const std::string& document_id) {
  if (document_id.empty()) {
    throw util::InvalidArgument("document id must not be empty");
  }
  for (char c : document_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("document id contains invalid character");
    }
  }
  if (document_id == "." || document_id == "..") {
    throw util::InvalidArgument("document id must not be a relative path component");
  }
}

inline std::filesystem::path DocumentPath(const std::filesystem::path& dir, const std::string& document_id) {
  ValidateDocumentId(document_id);
  return dir / (document_id + ".pdf");
}

} // namespace draft::storage::common
