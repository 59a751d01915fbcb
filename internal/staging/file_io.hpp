#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/status.hpp"

namespace relay::staging {

/*
  Durable local file primitives.

  Atomic write:
      write tmp -> fsync -> rename -> fsync(dir)

  A full volume (ENOSPC/EDQUOT, or less free space than the payload)
  throws util::ResourceExhausted; every other failure is kIOFailure.
*/

util::Status WriteAtomically(const std::filesystem::path& final_path, const std::filesystem::path& tmp_path, std::string_view bytes);

util::Status SyncDirectory(const std::filesystem::path& dir);

// Whole-file read for small files (markers, replay sources).
std::optional<std::string> ReadWholeFile(const std::filesystem::path& path, std::string* error = nullptr);

} // namespace relay::staging
