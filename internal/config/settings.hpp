#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/destination.hpp"

namespace relay::config {

struct TransferSettings {
  // attempted in this order for every payload
  std::vector<model::Destination> destinations;

  std::uint32_t             retry_limit = 2;
  std::chrono::milliseconds cycle_interval{20'000};
  std::chrono::milliseconds attempt_timeout{60'000};
  std::size_t               workers = 4;
};

struct ReplaySettings {
  std::filesystem::path     source_directory;
  std::filesystem::path     destination_directory;
  std::filesystem::path     temp_directory;
  std::size_t               max_files_per_cycle = 1;
  std::chrono::milliseconds sleep_interval{30'000};

  bool Enabled() const {
    return !source_directory.empty();
  }
};

/*
  Validated, immutable view of RuntimeConfig used by the pipeline.

  Built once in the composition root and handed to every component by
  const reference.
*/
struct PipelineSettings {
  std::filesystem::path    data_folder;
  std::vector<std::string> subsystems;

  TransferSettings transfer;
  ReplaySettings   replay;

  bool IsKnownSubsystem(std::string_view subsystem) const;
};

// Throws util::ConfigError naming the offending key.
PipelineSettings BuildSettings(const relay::runtime::config::RuntimeConfig& config);

// Reserved name and URI scheme detection for storage-grid sites.
model::Destination MakeDestination(const std::string& name, const std::string& target);

} // namespace relay::config
