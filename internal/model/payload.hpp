#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace relay::model {

/*
  A received monitoring payload.

  Content is opaque and never rewritten after receipt; only its location
  changes. Identity is (subsystem, filename).
*/
struct PayloadRef {
  std::string subsystem;
  std::string filename;
  std::string run_identifier;

  std::uint64_t   size_bytes = 0;
  util::TimePoint received_at{};

  std::string Key() const {
    return subsystem + "/" + filename;
  }
};

inline std::string PayloadKey(std::string_view subsystem, std::string_view filename) {
  std::string key;
  key.reserve(subsystem.size() + filename.size() + 1);
  key.append(subsystem);
  key.push_back('/');
  key.append(filename);
  return key;
}

// Returns the first "Run<digits>" token of `text`, or empty.
inline std::string FindRunIdentifier(std::string_view text) {
  for (std::size_t pos = text.find("Run"); pos != std::string_view::npos; pos = text.find("Run", pos + 1)) {
    std::size_t end = pos + 3;
    while (end < text.size() && text[end] >= '0' && text[end] <= '9') {
      ++end;
    }
    if (end > pos + 3) {
      return std::string(text.substr(pos, end - pos));
    }
  }
  return {};
}

inline bool IsRunIdentifier(std::string_view text) {
  return !text.empty() && FindRunIdentifier(text) == text;
}

} // namespace relay::model
