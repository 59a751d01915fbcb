#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/transfer/destination_sink.hpp"

namespace relay::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& name) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / ("dqm_relay_" + name + "_" + std::to_string(rd()));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline config::PipelineSettings MakeSettings(const std::filesystem::path& data_folder, std::vector<model::Destination> destinations = {},
                                             std::uint32_t retry_limit = 2) {
  config::PipelineSettings settings;
  settings.data_folder          = data_folder;
  settings.subsystems           = {"EMC", "TPC", "HLT"};
  settings.transfer.destinations = std::move(destinations);
  settings.transfer.retry_limit  = retry_limit;
  settings.transfer.workers      = 2;
  settings.transfer.cycle_interval  = std::chrono::milliseconds(10);
  settings.transfer.attempt_timeout = std::chrono::milliseconds(5'000);
  return settings;
}

/*
  Destination whose outcomes follow a script; once the script runs out
  every attempt succeeds. SetDelay() makes every attempt take that long,
  ignoring the deadline the way a hung remote call would.
*/
class ScriptedSink final : public transfer::DestinationSink {
 public:
  ScriptedSink(std::string name, std::vector<util::ErrorCode> script = {}) : name_(std::move(name)), script_(std::move(script)) {
  }

  const std::string& Name() const override {
    return name_;
  }

  void SetDelay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    delay_ = delay;
  }

  util::Status Deliver(const model::PayloadRef& ref, const std::filesystem::path& staged_file, transfer::Deadline) override {
    std::chrono::milliseconds delay;
    {
      std::lock_guard lock(mutex_);
      delay = delay_;
    }
    std::this_thread::sleep_for(delay);

    std::lock_guard lock(mutex_);
    const auto      attempt = attempts_++;
    const auto      code    = attempt < script_.size() ? script_[attempt] : util::ErrorCode::kOk;
    if (code != util::ErrorCode::kOk) {
      return util::Status::Err(code, "scripted failure " + std::to_string(attempt + 1));
    }
    delivered_.push_back(ref.Key());
    contents_.push_back(ReadFile(staged_file));
    return util::Status::Ok();
  }

  std::size_t Attempts() const {
    std::lock_guard lock(mutex_);
    return attempts_;
  }

  std::vector<std::string> Delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
  }

  std::vector<std::string> Contents() const {
    std::lock_guard lock(mutex_);
    return contents_;
  }

 private:
  std::string                  name_;
  std::vector<util::ErrorCode> script_;

  mutable std::mutex        mutex_;
  std::chrono::milliseconds delay_{0};
  std::size_t               attempts_ = 0;
  std::vector<std::string> delivered_;
  std::vector<std::string> contents_;
};

} // namespace relay::testing
