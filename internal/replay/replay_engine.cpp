#include "internal/replay/replay_engine.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include "internal/model/payload.hpp"
#include "internal/observability/logging.hpp"
#include "internal/staging/file_io.hpp"
#include "internal/staging/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace relay::replay {

namespace fs = std::filesystem;

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

constexpr std::string_view kRejectedDir = ".rejected";

std::string RunDirectoryName(const fs::path& directory) {
  auto normal = directory.lexically_normal();
  if (normal.filename().empty()) {
    normal = normal.parent_path();
  }
  return normal.filename().string();
}

util::Status IOFailure(const std::string& what, const std::error_code& ec) {
  return util::Status::Err(util::ErrorCode::kIOFailure, what + ": " + ec.message());
}

} // namespace

ReplayEngine::ReplayEngine(const config::PipelineSettings& settings, std::shared_ptr<ingest::Receiver> receiver)
    : settings_(settings),
      receiver_(std::move(receiver)),
      run_identifier_(model::FindRunIdentifier(RunDirectoryName(settings.replay.source_directory))) {
  if (!settings_.replay.Enabled()) {
    throw util::InvalidArgument("replay source directory not configured");
  }
  if (run_identifier_.empty()) {
    throw util::InvalidArgument("replay source directory carries no Run<number>: " + settings_.replay.source_directory.string());
  }
}

ReplayEngine::~ReplayEngine() {
  Stop();
}

// ------------------------------------------------------------------
// Listing
// ------------------------------------------------------------------

std::string ReplayEngine::SubsystemOf(std::string_view filename) const {
  std::string best;
  for (const auto& subsystem : settings_.subsystems) {
    if (filename.size() > subsystem.size() && filename.substr(0, subsystem.size()) == subsystem && subsystem.size() > best.size()) {
      best = subsystem;
    }
  }
  return best;
}

std::vector<ReplayEngine::SourceFile> ReplayEngine::ListClaimed() const {
  std::vector<SourceFile> claimed;
  for (const auto& subsystem : settings_.subsystems) {
    const auto      dir = settings_.replay.temp_directory / subsystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) continue;
    for (const auto& entry : fs::directory_iterator(dir)) {
      if (!entry.is_regular_file() || staging::IsHiddenEntry(entry.path())) continue;
      claimed.push_back({subsystem, entry.path()});
    }
  }
  std::sort(claimed.begin(), claimed.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.path.filename() == b.path.filename() ? a.subsystem < b.subsystem : a.path.filename() < b.path.filename();
  });
  return claimed;
}

std::vector<ReplayEngine::SourceFile> ReplayEngine::ListSource() {
  std::vector<SourceFile> files;
  const auto&             root = settings_.replay.source_directory;

  auto skip = [&](const fs::path& path, std::string_view reason) {
    if (warned_.insert(path).second) {
      RELAY_LOG_WARN("Skipping replay source entry", {StringField("path", path.string()), StringField("reason", reason)});
    }
  };

  for (const auto& entry : fs::directory_iterator(root)) {
    const auto& path = entry.path();
    if (staging::IsHiddenEntry(path)) continue;

    if (entry.is_directory()) {
      const auto subsystem = path.filename().string();
      if (!settings_.IsKnownSubsystem(subsystem)) {
        skip(path, "not a configured subsystem");
        continue;
      }
      for (const auto& inner : fs::directory_iterator(path)) {
        if (!inner.is_regular_file() || staging::IsHiddenEntry(inner.path())) continue;
        files.push_back({subsystem, inner.path()});
      }
    } else if (entry.is_regular_file()) {
      auto subsystem = SubsystemOf(path.filename().string());
      if (subsystem.empty()) {
        skip(path, "no configured subsystem prefixes the filename");
        continue;
      }
      files.push_back({std::move(subsystem), path});
    }
  }

  std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.path.filename() == b.path.filename() ? a.subsystem < b.subsystem : a.path.filename() < b.path.filename();
  });
  return files;
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

util::Status ReplayEngine::Claim(const SourceFile& source, SourceFile& claimed) const {
  const auto      dir = settings_.replay.temp_directory / source.subsystem;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return IOFailure("create " + dir.string(), ec);
  }

  claimed.subsystem = source.subsystem;
  claimed.path      = dir / source.path.filename();

  fs::rename(source.path, claimed.path, ec);
  if (!ec) {
    return util::Status::Ok();
  }
  if (ec != std::errc::cross_device_link) {
    return IOFailure("claim " + source.path.string(), ec);
  }

  // source on another volume: durable copy first, then drop the source
  std::string error;
  auto        bytes = staging::ReadWholeFile(source.path, &error);
  if (!bytes) {
    return util::Status::Err(util::ErrorCode::kIOFailure, error);
  }
  auto status = staging::WriteAtomically(claimed.path, staging::HiddenSibling(claimed.path, ".tmp"), *bytes);
  if (!status) {
    return status;
  }
  fs::remove(source.path, ec);
  if (ec) {
    return IOFailure("remove " + source.path.string(), ec);
  }
  return util::Status::Ok();
}

util::Status ReplayEngine::Inject(const SourceFile& claimed) {
  std::string error;
  auto        bytes = staging::ReadWholeFile(claimed.path, &error);
  if (!bytes) {
    return util::Status::Err(util::ErrorCode::kIOFailure, error);
  }

  const auto filename = claimed.path.filename().string();
  auto       result   = receiver_->Receive(claimed.subsystem, filename, *bytes, run_identifier_);
  if (!result.status) {
    return result.status;
  }

  std::error_code ec;
  fs::remove(claimed.path, ec);
  if (ec) {
    // durable in staging already; a leftover only causes a duplicate receipt
    RELAY_LOG_ERROR("Could not remove replayed file", {StringField("path", claimed.path.string()), StringField("error", ec.message())});
  }
  return util::Status::Ok();
}

void ReplayEngine::Reject(const SourceFile& claimed, const util::Status& status) const {
  const auto      dir = settings_.replay.temp_directory / kRejectedDir / claimed.subsystem;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (!ec) {
    fs::rename(claimed.path, dir / claimed.path.filename(), ec);
  }
  RELAY_LOG_ERROR("Replayed file rejected by the receiver",
                  {StringField("subsystem", claimed.subsystem), StringField("filename", claimed.path.filename().string()),
                   StringField("error", status.message), StringField("moved_to", ec ? "" : dir.string())});
}

ReplayCycle ReplayEngine::AdvanceOneCycle() {
  std::lock_guard lock(cycle_mutex_);
  ReplayCycle     cycle;

  std::error_code ec;
  if (!fs::is_directory(settings_.replay.source_directory, ec)) {
    cycle.status = util::Status::Err(util::ErrorCode::kIOFailure, "replay source directory missing: " + settings_.replay.source_directory.string());
    return cycle;
  }

  const auto limit = settings_.replay.max_files_per_cycle;

  auto handle = [&](const SourceFile& claimed) {
    auto status = Inject(claimed);
    if (status) {
      ++cycle.moved;
      RELAY_LOG_INFO("Replayed payload", {StringField("subsystem", claimed.subsystem), StringField("filename", claimed.path.filename().string()),
                                          StringField("run", run_identifier_)});
      return true;
    }
    if (status.code == util::ErrorCode::kInvalidArgument || status.code == util::ErrorCode::kUnknownSubsystem) {
      // retrying cannot succeed; keep the file out of the way
      Reject(claimed, status);
      return true;
    }
    cycle.status = std::move(status);
    return false;
  };

  std::size_t taken = 0;
  for (const auto& claimed : ListClaimed()) {
    if (taken == limit || !handle(claimed)) break;
    ++taken;
  }

  if (cycle.status) {
    for (const auto& source : ListSource()) {
      if (taken == limit) break;
      SourceFile   claimed;
      util::Status status;
      try {
        status = Claim(source, claimed);
      } catch (const util::ResourceExhausted& e) {
        status = util::Status::Err(util::ErrorCode::kResourceExhausted, e.what());
      }
      if (!status) {
        cycle.status = std::move(status);
        break;
      }
      ++taken;
      if (!handle(claimed)) break;
    }
  }

  cycle.remaining = ListClaimed().size() + ListSource().size();
  cycle.exhausted = cycle.status && cycle.remaining == 0;

  if (cycle.status.code == util::ErrorCode::kResourceExhausted) {
    fatal_ = true;
  }

  if (!cycle.status) {
    RELAY_LOG_ERROR("Replay cycle failed", {StringField("run", run_identifier_), StringField("error", cycle.status.message),
                                            IntField("moved", static_cast<std::int64_t>(cycle.moved))});
  } else {
    RELAY_LOG_INFO("Replay cycle finished", {StringField("run", run_identifier_), IntField("moved", static_cast<std::int64_t>(cycle.moved)),
                                             IntField("remaining", static_cast<std::int64_t>(cycle.remaining))});
  }
  return cycle;
}

// ------------------------------------------------------------------
// Loop
// ------------------------------------------------------------------

void ReplayEngine::Start() {
  if (running_.exchange(true)) return;
  RELAY_LOG_INFO("Replay started", {StringField("source", settings_.replay.source_directory.string()), StringField("run", run_identifier_),
                                    IntField("max_files_per_cycle", static_cast<std::int64_t>(settings_.replay.max_files_per_cycle))});
  thread_ = std::thread(&ReplayEngine::Loop, this);
}

void ReplayEngine::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReplayEngine::Loop() {
  while (running_ && !fatal_) {
    try {
      const auto cycle = AdvanceOneCycle();
      if (cycle.exhausted) {
        finished_ = true;
        RELAY_LOG_INFO("Replay source exhausted", {StringField("run", run_identifier_)});
        break;
      }
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("Replay cycle aborted", {StringField("error", e.what())});
    }

    if (fatal_ || receiver_->Exhausted()) {
      fatal_ = true;
      RELAY_LOG_ERROR("Volume exhausted, replay stopped", {StringField("run", run_identifier_)});
      break;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, settings_.replay.sleep_interval, [&] { return !running_.load(); });
  }
}

} // namespace relay::replay
