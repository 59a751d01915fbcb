#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/payload.hpp"
#include "internal/model/staging_location.hpp"
#include "internal/util/status.hpp"

namespace relay::staging {

struct StagedFile {
  std::string   subsystem;
  std::string   filename;
  std::uint64_t size_bytes = 0;

  std::filesystem::file_time_type modified_at{};
};

/*
  On-disk file-state machine shared by the receiver, the transfer
  manager and the replay engine.

  Layout:
    <data>/<subsystem>/Incoming/<filename>
    <data>/tempStorage/<subsystem>/<filename>
    <data>/tempStorage/<subsystem>/.<filename>.failed   inspection marker
    <data>/tempStorage/.inspection/<subsystem>/          flagged copies set aside

  Every transition is a rename within the data volume, so a file is
  visible in exactly one location and a crash leaves it in its
  pre-transition location. Only this class moves staged files.

  All methods are safe to call concurrently; coordination is carried by
  the renames themselves.
*/
class StagingStore {
 public:
  StagingStore(std::filesystem::path data_folder, std::vector<std::string> subsystems);

  // Creates Incoming and tempStorage directories for every subsystem.
  void EnsureLayout() const;

  std::filesystem::path PathOf(model::StagingLocation location, std::string_view subsystem, std::string_view filename) const;
  std::filesystem::path MarkerPath(std::string_view subsystem, std::string_view filename) const;

  const std::filesystem::path& DataFolder() const {
    return data_folder_;
  }

  // Writes into Incoming through a hidden temp file; the rename publishes it.
  // Throws util::ResourceExhausted when the volume is full.
  util::Status Admit(const model::PayloadRef& ref, std::string_view bytes) const;

  // Incoming -> TempStorage. Already claimed counts as success.
  util::Status Claim(std::string_view subsystem, std::string_view filename) const;

  // TempStorage -> Incoming. When Incoming already holds a newer copy the
  // staged copy is discarded instead.
  util::Status Release(std::string_view subsystem, std::string_view filename) const;

  // Removes the staged copy and its marker once every destination has it.
  util::Status Retire(std::string_view subsystem, std::string_view filename) const;

  bool Exists(model::StagingLocation location, std::string_view subsystem, std::string_view filename) const;

  // Visible files only, oldest first (then by name).
  std::vector<StagedFile> List(model::StagingLocation location) const;

  util::Status FlagForInspection(std::string_view subsystem, std::string_view filename, std::string_view report) const;
  void         ClearInspection(std::string_view subsystem, std::string_view filename) const;
  bool         IsFlagged(std::string_view subsystem, std::string_view filename) const;

  // Moves a flagged TempStorage copy and its marker into InspectionDir(),
  // freeing the name for a newer copy. An earlier copy set aside under the
  // same name is kept; the later one gets a numeric suffix.
  util::Status          SetAside(std::string_view subsystem, std::string_view filename) const;
  std::filesystem::path InspectionDir(std::string_view subsystem) const;

  // Drops receipt temp files left by an interrupted Admit(). Returns the count.
  std::size_t RemoveStaleTemps() const;

 private:
  std::filesystem::path IncomingDir(std::string_view subsystem) const;
  std::filesystem::path TempStorageDir(std::string_view subsystem) const;

  util::Status Move(const std::filesystem::path& from, const std::filesystem::path& to) const;

  std::filesystem::path    data_folder_;
  std::vector<std::string> subsystems_;
};

} // namespace relay::staging
