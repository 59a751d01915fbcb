#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace relay::staging {

// Single path component, visible to scans (dot-prefixed names are reserved
// for temp files and markers).
inline void ValidateFilename(std::string_view filename) {
  if (filename.empty()) {
    throw util::InvalidArgument("filename must not be empty");
  }
  for (char c : filename) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("filename contains invalid character: " + std::string(filename));
    }
  }
  if (filename == "." || filename == "..") {
    throw util::InvalidArgument("filename must not be a relative path component");
  }
  if (filename.front() == '.') {
    throw util::InvalidArgument("filename must not start with '.': " + std::string(filename));
  }
}

inline bool IsHiddenEntry(const std::filesystem::path& path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

inline std::filesystem::path HiddenSibling(const std::filesystem::path& path, std::string_view suffix) {
  return path.parent_path() / ("." + path.filename().string() + std::string(suffix));
}

} // namespace relay::staging
