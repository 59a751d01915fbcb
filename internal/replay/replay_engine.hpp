#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/ingest/payload_source.hpp"
#include "internal/ingest/receiver.hpp"
#include "internal/util/status.hpp"

namespace relay::replay {

struct ReplayCycle {
  util::Status status;
  std::size_t  moved     = 0;
  bool         exhausted = false;
  std::size_t  remaining = 0;
};

/*
  Feeds a recorded run directory back through the Receiver.

  Source layout, either:
    <run>/<subsystem>/<filename>
    <run>/<filename>              subsystem = configured tag prefixing the name

  A cycle renames up to max_files_per_cycle files (filename order) into
  <temp>/<subsystem>/, receives each and deletes the claimed copy only once
  the Receiver has made it durable. The residual listing is the only
  resumption state: claimed leftovers are injected first after a restart.

  A full staging or replay temp volume latches Fatal() and ends the loop.
*/
class ReplayEngine final : public ingest::PayloadSource {
 public:
  ReplayEngine(const config::PipelineSettings& settings, std::shared_ptr<ingest::Receiver> receiver);
  ~ReplayEngine() override;

  std::string_view Name() const override {
    return "replay";
  }

  void Start() override;
  void Stop() override;
  bool Finished() const override {
    return finished_.load();
  }
  bool Fatal() const override {
    return fatal_.load();
  }

  ReplayCycle AdvanceOneCycle();

  const std::string& RunIdentifier() const {
    return run_identifier_;
  }

 private:
  struct SourceFile {
    std::string           subsystem;
    std::filesystem::path path;
  };

  std::vector<SourceFile> ListClaimed() const;
  std::vector<SourceFile> ListSource();
  std::string             SubsystemOf(std::string_view filename) const;

  util::Status Claim(const SourceFile& source, SourceFile& claimed) const;
  util::Status Inject(const SourceFile& claimed);
  void         Reject(const SourceFile& claimed, const util::Status& status) const;

  void Loop();

  const config::PipelineSettings&  settings_;
  std::shared_ptr<ingest::Receiver> receiver_;
  std::string                       run_identifier_;

  std::mutex                      cycle_mutex_;
  std::set<std::filesystem::path> warned_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<bool>       finished_{false};
  std::atomic<bool>       fatal_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
};

} // namespace relay::replay
