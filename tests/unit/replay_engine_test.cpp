#include "internal/replay/replay_engine.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/receiver.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using relay::db::memory::MemoryRepository;
using relay::ingest::Receiver;
using relay::model::StagingLocation;
using relay::replay::ReplayEngine;
using relay::staging::StagingStore;
using relay::testing::MakeSettings;
using relay::testing::ReadFile;
using relay::testing::TempDir;
using relay::testing::WriteFile;

struct Fixture {
  Fixture(const std::string& name, const std::string& run, std::size_t max_files) : dir(name) {
    settings                              = MakeSettings(dir.path() / "data");
    settings.replay.source_directory      = dir.path() / "archive" / run;
    settings.replay.destination_directory = settings.data_folder;
    settings.replay.temp_directory        = dir.path() / "replay_temp";
    settings.replay.max_files_per_cycle   = max_files;
    settings.replay.sleep_interval        = std::chrono::milliseconds(10);

    staging    = std::make_shared<StagingStore>(settings.data_folder, settings.subsystems);
    repository = std::make_shared<MemoryRepository>();
    staging->EnsureLayout();
    receiver = std::make_shared<Receiver>(settings, staging, repository);
  }

  fs::path Source() const {
    return settings.replay.source_directory;
  }

  std::string RunOf(const std::string& key) {
    auto tx     = repository->Begin();
    auto record = repository->GetPayload(*tx, key);
    tx->Commit();
    assert(record.has_value());
    return record->run_identifier;
  }

  TempDir                           dir;
  relay::config::PipelineSettings   settings;
  std::shared_ptr<StagingStore>     staging;
  std::shared_ptr<MemoryRepository> repository;
  std::shared_ptr<Receiver>         receiver;
};

void TestOneFilePerCycleInFilenameOrder() {
  Fixture f("replay_order", "Run123", 1);
  WriteFile(f.Source() / "EMC" / "c.root", "c");
  WriteFile(f.Source() / "EMC" / "a.root", "a");
  WriteFile(f.Source() / "EMC" / "b.root", "b");

  ReplayEngine engine(f.settings, f.receiver);
  assert(engine.RunIdentifier() == "Run123");

  auto first = engine.AdvanceOneCycle();
  assert(first.status);
  assert(first.moved == 1);
  assert(first.remaining == 2);
  assert(!first.exhausted);
  assert(f.staging->Exists(StagingLocation::kIncoming, "EMC", "a.root"));
  assert(!f.staging->Exists(StagingLocation::kIncoming, "EMC", "b.root"));

  auto second = engine.AdvanceOneCycle();
  assert(second.moved == 1);
  assert(f.staging->Exists(StagingLocation::kIncoming, "EMC", "b.root"));

  auto third = engine.AdvanceOneCycle();
  assert(third.moved == 1);
  assert(third.exhausted);

  assert(ReadFile(f.staging->PathOf(StagingLocation::kIncoming, "EMC", "c.root")) == "c");
  assert(f.RunOf("EMC/c.root") == "Run123");
  assert(fs::is_empty(f.Source() / "EMC"));
  assert(fs::is_empty(f.settings.replay.temp_directory / "EMC"));
}

void TestBatchesOfTwoTakeThreeCyclesForFiveFiles() {
  Fixture f("replay_batches", "Run31", 2);
  for (const auto* name : {"e.root", "d.root", "c.root", "b.root", "a.root"}) {
    WriteFile(f.Source() / "HLT" / name, name);
  }

  ReplayEngine engine(f.settings, f.receiver);

  auto first = engine.AdvanceOneCycle();
  assert(first.moved == 2);
  assert(first.remaining == 3);
  assert(!first.exhausted);
  assert(f.staging->Exists(StagingLocation::kIncoming, "HLT", "a.root"));
  assert(f.staging->Exists(StagingLocation::kIncoming, "HLT", "b.root"));

  auto second = engine.AdvanceOneCycle();
  assert(second.moved == 2);
  assert(second.remaining == 1);
  assert(!second.exhausted);

  auto third = engine.AdvanceOneCycle();
  assert(third.moved == 1);
  assert(third.remaining == 0);
  assert(third.exhausted);
  assert(f.staging->List(StagingLocation::kIncoming).size() == 5);
}

void TestClaimedLeftoversGoFirstAfterRestart() {
  Fixture f("replay_restart", "Run9", 1);
  WriteFile(f.Source() / "TPC" / "a.root", "a");
  // claimed by a previous process that stopped before injecting it
  WriteFile(f.settings.replay.temp_directory / "TPC" / "z.root", "z");

  ReplayEngine engine(f.settings, f.receiver);

  auto first = engine.AdvanceOneCycle();
  assert(first.moved == 1);
  assert(f.staging->Exists(StagingLocation::kIncoming, "TPC", "z.root"));
  assert(fs::exists(f.Source() / "TPC" / "a.root"));

  auto second = engine.AdvanceOneCycle();
  assert(second.exhausted);
  assert(f.staging->Exists(StagingLocation::kIncoming, "TPC", "a.root"));

  // nothing left, nothing replayed twice
  auto third = engine.AdvanceOneCycle();
  assert(third.moved == 0);
  assert(third.exhausted);
}

void TestFilesAtRunRootAreMatchedBySubsystemPrefix() {
  Fixture f("replay_prefix", "Run7", 10);
  WriteFile(f.Source() / "TPCtracks_1.root", "t");
  WriteFile(f.Source() / "HLTtrigger.root", "h");
  WriteFile(f.Source() / "README.txt", "not a payload");
  WriteFile(f.Source() / "XYZ" / "x.root", "x");

  ReplayEngine engine(f.settings, f.receiver);
  auto         cycle = engine.AdvanceOneCycle();
  assert(cycle.status);
  assert(cycle.moved == 2);
  assert(cycle.exhausted);

  assert(f.staging->Exists(StagingLocation::kIncoming, "TPC", "TPCtracks_1.root"));
  assert(f.staging->Exists(StagingLocation::kIncoming, "HLT", "HLTtrigger.root"));
  // unmatched entries are left in place
  assert(fs::exists(f.Source() / "README.txt"));
  assert(fs::exists(f.Source() / "XYZ" / "x.root"));
}

void TestMissingSourceDirectoryFailsTheCycle() {
  Fixture      f("replay_missing", "Run1", 1);
  ReplayEngine engine(f.settings, f.receiver);

  auto cycle = engine.AdvanceOneCycle();
  assert(!cycle.status);
  assert(cycle.status.code == relay::util::ErrorCode::kIOFailure);
  assert(!cycle.exhausted);
}

void TestSourceWithoutRunNumberIsRejected() {
  Fixture f("replay_norun", "archive_latest", 1);

  bool threw = false;
  try {
    ReplayEngine engine(f.settings, f.receiver);
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestLoopFinishesWhenSourceIsDrained() {
  Fixture f("replay_loop", "Run55", 1);
  WriteFile(f.Source() / "EMC" / "a.root", "a");
  WriteFile(f.Source() / "EMC" / "b.root", "b");

  ReplayEngine engine(f.settings, f.receiver);
  engine.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!engine.Finished() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  engine.Stop();

  assert(engine.Finished());
  assert(f.staging->Exists(StagingLocation::kIncoming, "EMC", "a.root"));
  assert(f.staging->Exists(StagingLocation::kIncoming, "EMC", "b.root"));
}

void TestLoopSleepsBetweenCycles() {
  using namespace std::chrono_literals;

  Fixture f("replay_sleep", "Run56", 1);
  f.settings.replay.sleep_interval = 200ms;
  WriteFile(f.Source() / "EMC" / "a.root", "a");
  WriteFile(f.Source() / "EMC" / "b.root", "b");
  WriteFile(f.Source() / "EMC" / "c.root", "c");

  ReplayEngine engine(f.settings, f.receiver);
  const auto   started = std::chrono::steady_clock::now();
  engine.Start();

  const auto deadline = started + 10s;
  while (!engine.Finished() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  engine.Stop();

  assert(engine.Finished());
  // three cycles, two pauses
  assert(elapsed >= 400ms);

  auto received_ms = [&](const std::string& key) {
    auto tx     = f.repository->Begin();
    auto record = f.repository->GetPayload(*tx, key);
    tx->Commit();
    assert(record.has_value());
    return record->received_at_ms;
  };
  const auto a = received_ms("EMC/a.root");
  const auto b = received_ms("EMC/b.root");
  const auto c = received_ms("EMC/c.root");
  assert(b >= a + 199);
  assert(c >= b + 199);
}

void TestFullVolumeStopsReplay() {
  using namespace std::chrono_literals;

  Fixture f("replay_full", "Run8", 2);
  WriteFile(f.Source() / "EMC" / "a.root", "a");
  WriteFile(f.Source() / "EMC" / "b.root", "b");

  // every write of the receipt temp file for a.root hits a full device
  const auto receipt = f.settings.data_folder / "EMC" / "Incoming" / ".a.root.tmp";
  fs::create_symlink("/dev/full", receipt);

  ReplayEngine engine(f.settings, f.receiver);
  auto         cycle = engine.AdvanceOneCycle();
  assert(!cycle.status);
  assert(cycle.status.code == relay::util::ErrorCode::kResourceExhausted);
  assert(cycle.moved == 0);
  assert(engine.Fatal());
  assert(!engine.Finished());

  // the claimed copy waits for the operator; nothing else is claimed
  assert(fs::exists(f.settings.replay.temp_directory / "EMC" / "a.root"));
  assert(fs::exists(f.Source() / "EMC" / "b.root"));

  engine.Start();
  std::this_thread::sleep_for(100ms);
  engine.Stop();
  assert(!f.staging->Exists(StagingLocation::kIncoming, "EMC", "a.root"));
  assert(fs::exists(f.Source() / "EMC" / "b.root"));
}

} // namespace

int main() {
  TestOneFilePerCycleInFilenameOrder();
  TestBatchesOfTwoTakeThreeCyclesForFiveFiles();
  TestClaimedLeftoversGoFirstAfterRestart();
  TestFilesAtRunRootAreMatchedBySubsystemPrefix();
  TestMissingSourceDirectoryFailsTheCycle();
  TestSourceWithoutRunNumberIsRejected();
  TestLoopFinishesWhenSourceIsDrained();
  TestLoopSleepsBetweenCycles();
  TestFullVolumeStopsReplay();

  std::cout << "dqm_relay_unit_replay_engine: pass\n";
  return 0;
}
