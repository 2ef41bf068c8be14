#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkscribe::storage::common {

/*
  A blob key is one or more '/'-separated components. Components must be
  non-empty, must not be "." or "..", and must not contain '\\' or NUL.
*/
inline void ValidateBlobKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("blob key must not be empty");
  }
  if (key.front() == '/') {
    throw std::invalid_argument("blob key must be relative");
  }

  std::string_view rest = key;
  while (true) {
    const auto       slash     = rest.find('/');
    std::string_view component = rest.substr(0, slash);
    if (component.empty()) {
      throw std::invalid_argument("blob key contains an empty component");
    }
    if (component == "." || component == "..") {
      throw std::invalid_argument("blob key must not contain relative path components");
    }
    for (char c : component) {
      if (c == '\\' || c == '\0') {
        throw std::invalid_argument("blob key contains invalid character");
      }
    }
    if (slash == std::string_view::npos) break;
    rest.remove_prefix(slash + 1);
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& key) {
  ValidateBlobKey(key);
  return root / key;
}

} // namespace chunkscribe::storage::common
