#include "internal/staging/staging_store.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/staging/file_io.hpp"
#include "internal/staging/path_utils.hpp"

namespace relay::staging {

using relay::observability::IntField;
using relay::observability::StringField;

namespace fs = std::filesystem;

namespace {

constexpr const char* kIncomingDir    = "Incoming";
constexpr const char* kTempStorageDir = "tempStorage";
constexpr const char* kReceiptSuffix  = ".tmp";
constexpr const char* kMarkerSuffix   = ".failed";
constexpr const char* kInspectionDir  = ".inspection";

util::Status IoError(const std::string& what, const fs::path& path, const std::error_code& ec) {
  return util::Status::Err(util::ErrorCode::kIOFailure, what + " " + path.string() + ": " + ec.message());
}

} // namespace

StagingStore::StagingStore(fs::path data_folder, std::vector<std::string> subsystems)
    : data_folder_(std::move(data_folder)), subsystems_(std::move(subsystems)) {
}

void StagingStore::EnsureLayout() const {
  for (const auto& subsystem : subsystems_) {
    fs::create_directories(IncomingDir(subsystem));
    fs::create_directories(TempStorageDir(subsystem));
  }
}

fs::path StagingStore::IncomingDir(std::string_view subsystem) const {
  return data_folder_ / std::string(subsystem) / kIncomingDir;
}

fs::path StagingStore::TempStorageDir(std::string_view subsystem) const {
  return data_folder_ / kTempStorageDir / std::string(subsystem);
}

fs::path StagingStore::PathOf(model::StagingLocation location, std::string_view subsystem, std::string_view filename) const {
  const auto dir = location == model::StagingLocation::kIncoming ? IncomingDir(subsystem) : TempStorageDir(subsystem);
  return dir / std::string(filename);
}

fs::path StagingStore::MarkerPath(std::string_view subsystem, std::string_view filename) const {
  return HiddenSibling(PathOf(model::StagingLocation::kTempStorage, subsystem, filename), kMarkerSuffix);
}

util::Status StagingStore::Admit(const model::PayloadRef& ref, std::string_view bytes) const {
  ValidateFilename(ref.filename);

  const auto final_path = PathOf(model::StagingLocation::kIncoming, ref.subsystem, ref.filename);

  std::error_code ec;
  fs::create_directories(final_path.parent_path(), ec);
  if (ec) {
    return IoError("create", final_path.parent_path(), ec);
  }

  return WriteAtomically(final_path, HiddenSibling(final_path, kReceiptSuffix), bytes);
}

util::Status StagingStore::Move(const fs::path& from, const fs::path& to) const {
  std::error_code ec;
  fs::create_directories(to.parent_path(), ec);
  if (ec) {
    return IoError("create", to.parent_path(), ec);
  }
  fs::rename(from, to, ec);
  if (ec) {
    return IoError("rename", from, ec);
  }
  return util::Status::Ok();
}

util::Status StagingStore::Claim(std::string_view subsystem, std::string_view filename) const {
  const auto from = PathOf(model::StagingLocation::kIncoming, subsystem, filename);
  const auto to   = PathOf(model::StagingLocation::kTempStorage, subsystem, filename);

  std::error_code ec;
  const bool      in_incoming = fs::exists(from, ec);
  const bool      in_temp     = fs::exists(to, ec);

  if (in_temp) {
    // an older copy is still being delivered; the new one waits in Incoming
    return in_incoming ? util::Status::Err(util::ErrorCode::kInvalidArgument, "older copy still in temp storage: " + to.string())
                       : util::Status::Ok();
  }
  if (!in_incoming) {
    return util::Status::Err(util::ErrorCode::kIOFailure, "not staged: " + from.string());
  }
  return Move(from, to);
}

util::Status StagingStore::Release(std::string_view subsystem, std::string_view filename) const {
  const auto from = PathOf(model::StagingLocation::kTempStorage, subsystem, filename);
  const auto to   = PathOf(model::StagingLocation::kIncoming, subsystem, filename);

  std::error_code ec;
  if (fs::exists(to, ec)) {
    RELAY_LOG_INFO("Newer copy arrived while staged, discarding older copy",
                   {StringField("subsystem", subsystem), StringField("filename", filename)});
    fs::remove(from, ec);
    if (ec) {
      return IoError("remove", from, ec);
    }
    ClearInspection(subsystem, filename);
    return util::Status::Ok();
  }
  if (!fs::exists(from, ec)) {
    return util::Status::Err(util::ErrorCode::kIOFailure, "not in temp storage: " + from.string());
  }

  ClearInspection(subsystem, filename);
  return Move(from, to);
}

util::Status StagingStore::Retire(std::string_view subsystem, std::string_view filename) const {
  const auto path = PathOf(model::StagingLocation::kTempStorage, subsystem, filename);

  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    return IoError("remove", path, ec);
  }
  ClearInspection(subsystem, filename);
  return util::Status::Ok();
}

bool StagingStore::Exists(model::StagingLocation location, std::string_view subsystem, std::string_view filename) const {
  std::error_code ec;
  return fs::is_regular_file(PathOf(location, subsystem, filename), ec);
}

std::vector<StagedFile> StagingStore::List(model::StagingLocation location) const {
  std::vector<StagedFile> files;

  for (const auto& subsystem : subsystems_) {
    const auto      dir = location == model::StagingLocation::kIncoming ? IncomingDir(subsystem) : TempStorageDir(subsystem);
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      continue;
    }
    for (const auto& entry : it) {
      if (IsHiddenEntry(entry.path()) || !entry.is_regular_file(ec)) {
        continue;
      }
      StagedFile file;
      file.subsystem   = subsystem;
      file.filename    = entry.path().filename().string();
      file.size_bytes  = entry.file_size(ec);
      file.modified_at = entry.last_write_time(ec);
      files.push_back(std::move(file));
    }
  }

  std::sort(files.begin(), files.end(), [](const StagedFile& a, const StagedFile& b) {
    return std::tie(a.modified_at, a.subsystem, a.filename) < std::tie(b.modified_at, b.subsystem, b.filename);
  });
  return files;
}

util::Status StagingStore::FlagForInspection(std::string_view subsystem, std::string_view filename, std::string_view report) const {
  const auto marker = MarkerPath(subsystem, filename);
  return WriteAtomically(marker, HiddenSibling(marker, kReceiptSuffix), report);
}

void StagingStore::ClearInspection(std::string_view subsystem, std::string_view filename) const {
  std::error_code ec;
  fs::remove(MarkerPath(subsystem, filename), ec);
}

bool StagingStore::IsFlagged(std::string_view subsystem, std::string_view filename) const {
  std::error_code ec;
  return fs::exists(MarkerPath(subsystem, filename), ec);
}

fs::path StagingStore::InspectionDir(std::string_view subsystem) const {
  return data_folder_ / kTempStorageDir / kInspectionDir / std::string(subsystem);
}

util::Status StagingStore::SetAside(std::string_view subsystem, std::string_view filename) const {
  const auto from = PathOf(model::StagingLocation::kTempStorage, subsystem, filename);
  const auto dir  = InspectionDir(subsystem);

  std::error_code ec;
  auto            to = dir / std::string(filename);
  for (int n = 1; fs::exists(to, ec); ++n) {
    to = dir / (std::string(filename) + "." + std::to_string(n));
  }
  if (auto moved = Move(from, to); !moved) {
    return moved;
  }

  const auto marker = MarkerPath(subsystem, filename);
  if (fs::exists(marker, ec)) {
    fs::rename(marker, HiddenSibling(to, kMarkerSuffix), ec);
    if (ec) {
      RELAY_LOG_WARN("Could not move inspection marker", {StringField("marker", marker.string()), StringField("error", ec.message())});
    }
  }
  RELAY_LOG_WARN("Flagged payload set aside", {StringField("subsystem", subsystem), StringField("path", to.string())});
  return util::Status::Ok();
}

std::size_t StagingStore::RemoveStaleTemps() const {
  std::size_t removed = 0;

  for (const auto& subsystem : subsystems_) {
    for (const auto& dir : {IncomingDir(subsystem), TempStorageDir(subsystem)}) {
      std::error_code        ec;
      fs::directory_iterator it(dir, ec);
      if (ec) {
        continue;
      }
      for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (!IsHiddenEntry(entry.path()) || !name.ends_with(kReceiptSuffix)) {
          continue;
        }
        if (fs::remove(entry.path(), ec)) {
          ++removed;
        }
      }
    }
  }

  if (removed > 0) {
    RELAY_LOG_INFO("Removed interrupted receipt files", {IntField("count", static_cast<std::int64_t>(removed))});
  }
  return removed;
}

} // namespace relay::staging
