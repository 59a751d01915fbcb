#pragma once

#include <cstdint>
#include <string_view>

namespace relay::model {

enum class StagingLocation : std::uint8_t {
  kIncoming    = 0,
  kTempStorage = 1,
};

constexpr std::string_view ToString(StagingLocation location) {
  switch (location) {
    case StagingLocation::kIncoming:
      return "incoming";
    case StagingLocation::kTempStorage:
      return "temp_storage";
  }
  return "unknown";
}

} // namespace relay::model
