#include "settings.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/model/payload.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::config {

using relay::observability::StringField;

namespace {

constexpr std::string_view kStorageGridName = "EOS";
constexpr std::string_view kTempStorageDir  = "tempStorage";

[[noreturn]] void Fail(std::string_view key, std::string_view reason) {
  throw util::ConfigError("invalid configuration key '" + std::string(key) + "': " + std::string(reason));
}

std::filesystem::path Normalized(const std::filesystem::path& path) {
  auto normal = path.lexically_normal();
  if (normal.has_parent_path() && normal.filename().empty()) {
    normal = normal.parent_path();
  }
  return normal;
}

std::string UriScheme(const std::string& target) {
  const auto pos = target.find("://");
  if (pos == std::string::npos || pos == 0) {
    return {};
  }
  return target.substr(0, pos);
}

void ValidateSubsystemTag(const std::string& tag) {
  if (tag.empty()) {
    Fail("subsystemList", "empty subsystem tag");
  }
  if (tag.find('/') != std::string::npos || tag.find('\\') != std::string::npos || tag.front() == '.') {
    Fail("subsystemList", "subsystem tag '" + tag + "' is not a plain directory name");
  }
  if (tag == kTempStorageDir) {
    Fail("subsystemList", "subsystem tag collides with the temp storage directory");
  }
}

} // namespace

bool PipelineSettings::IsKnownSubsystem(std::string_view subsystem) const {
  return std::find(subsystems.begin(), subsystems.end(), subsystem) != subsystems.end();
}

model::Destination MakeDestination(const std::string& name, const std::string& target) {
  const auto scheme = UriScheme(target);
  if (scheme == "file") {
    return model::FilesystemSite{name, target.substr(std::string("file://").size())};
  }
  if (name == kStorageGridName || !scheme.empty()) {
    return model::StorageGridSite{name, target};
  }
  return model::FilesystemSite{name, target};
}

PipelineSettings BuildSettings(const relay::runtime::config::RuntimeConfig& config) {
  PipelineSettings settings;

  settings.data_folder = config.data_folder().empty() ? std::filesystem::path{"data"} : std::filesystem::path{config.data_folder()};

  std::unordered_set<std::string> seen_subsystems;
  for (const auto& tag : config.subsystem_list()) {
    ValidateSubsystemTag(tag);
    if (!seen_subsystems.insert(tag).second) {
      Fail("subsystemList", "duplicate subsystem tag '" + tag + "'");
    }
    settings.subsystems.push_back(tag);
  }
  if (settings.subsystems.empty()) {
    Fail("subsystemList", "at least one subsystem is required");
  }

  // ------------------------------------------------------------------
  // Transfer
  // ------------------------------------------------------------------
  auto& transfer = settings.transfer;

  if (config.data_transfer_retries() < 0) {
    Fail("dataTransferRetries", "must not be negative");
  }
  if (config.data_transfer_retries() > 0) {
    transfer.retry_limit = static_cast<std::uint32_t>(config.data_transfer_retries());
  }
  if (config.data_transfer_time_to_sleep() < 0) {
    Fail("dataTransferTimeToSleep", "must not be negative");
  }
  if (config.data_transfer_time_to_sleep() > 0) {
    transfer.cycle_interval = util::SecondsToMillis(config.data_transfer_time_to_sleep());
  }
  if (config.data_transfer_timeout() < 0) {
    Fail("dataTransferTimeout", "must not be negative");
  }
  if (config.data_transfer_timeout() > 0) {
    transfer.attempt_timeout = util::SecondsToMillis(config.data_transfer_timeout());
  }
  if (config.data_transfer_workers() > 0) {
    transfer.workers = config.data_transfer_workers();
  }

  std::unordered_set<std::string> seen_sites;
  for (const auto& location : config.data_transfer_locations()) {
    if (location.name().empty()) {
      Fail("dataTransferLocations", "site name must not be empty");
    }
    if (!seen_sites.insert(location.name()).second) {
      Fail("dataTransferLocations", "duplicate site '" + location.name() + "'");
    }
    if (location.target().empty()) {
      RELAY_LOG_WARN("Skipping transfer location without a target", {StringField("site", location.name())});
      continue;
    }
    transfer.destinations.push_back(MakeDestination(location.name(), location.target()));
  }

  // ------------------------------------------------------------------
  // Replay
  // ------------------------------------------------------------------
  auto& replay = settings.replay;

  if (!config.data_replay_source_directory().empty()) {
    replay.source_directory = config.data_replay_source_directory();
    const auto run_dir      = replay.source_directory.lexically_normal().filename().string().empty()
                                  ? replay.source_directory.lexically_normal().parent_path().filename().string()
                                  : replay.source_directory.lexically_normal().filename().string();
    if (model::FindRunIdentifier(run_dir).empty()) {
      Fail("dataReplaySourceDirectory", "directory name must contain Run<number>, got '" + run_dir + "'");
    }
  }

  replay.destination_directory = config.data_replay_destination_directory().empty()
                                     ? settings.data_folder
                                     : std::filesystem::path{config.data_replay_destination_directory()};
  replay.temp_directory = config.data_replay_temp_storage_directory().empty()
                              ? settings.data_folder / "tempReplayData"
                              : std::filesystem::path{config.data_replay_temp_storage_directory()};

  // replayed payloads go through the Receiver, which writes into the data folder
  if (replay.Enabled() && Normalized(replay.destination_directory) != Normalized(settings.data_folder)) {
    Fail("dataReplayDestinationDirectory", "must be the data folder '" + settings.data_folder.string() + "'");
  }

  if (config.data_replay_max_files_per_replay() < 0) {
    Fail("dataReplayMaxFilesPerReplay", "must be at least 1");
  }
  if (config.data_replay_max_files_per_replay() > 0) {
    replay.max_files_per_cycle = static_cast<std::size_t>(config.data_replay_max_files_per_replay());
  }
  if (config.data_replay_time_to_sleep() < 0) {
    Fail("dataReplayTimeToSleep", "must not be negative");
  }
  if (config.data_replay_time_to_sleep() > 0) {
    replay.sleep_interval = util::SecondsToMillis(config.data_replay_time_to_sleep());
  }

  return settings;
}

} // namespace relay::config
