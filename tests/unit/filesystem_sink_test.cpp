#include "internal/transfer/filesystem_sink.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using relay::model::FilesystemSite;
using relay::model::PayloadRef;
using relay::testing::ReadFile;
using relay::testing::TempDir;
using relay::testing::WriteFile;
using relay::transfer::FilesystemSink;
using relay::util::ErrorCode;

PayloadRef Ref(const std::string& subsystem, const std::string& filename) {
  PayloadRef ref;
  ref.subsystem = subsystem;
  ref.filename  = filename;
  return ref;
}

relay::transfer::Deadline Later() {
  return std::chrono::steady_clock::now() + std::chrono::seconds(30);
}

void TestCopiesIntoSubsystemDirectory() {
  TempDir dir("fs_sink_copy");
  WriteFile(dir.path() / "staged" / "a.root", "payload bytes");

  FilesystemSink sink(FilesystemSite{"site1", (dir.path() / "site1").string()});
  assert(sink.Name() == "site1");

  auto status = sink.Deliver(Ref("EMC", "a.root"), dir.path() / "staged" / "a.root", Later());
  assert(status);
  assert(ReadFile(dir.path() / "site1" / "EMC" / "a.root") == "payload bytes");
  assert(!fs::exists(dir.path() / "site1" / "EMC" / ".a.root.part"));
  // staged copy is left alone
  assert(fs::exists(dir.path() / "staged" / "a.root"));
}

void TestRedeliveryOfIdenticalContentSucceeds() {
  TempDir dir("fs_sink_same");
  WriteFile(dir.path() / "staged" / "a.root", "same");
  WriteFile(dir.path() / "site1" / "EMC" / "a.root", "same");

  FilesystemSink sink(FilesystemSite{"site1", (dir.path() / "site1").string()});
  assert(sink.Deliver(Ref("EMC", "a.root"), dir.path() / "staged" / "a.root", Later()));
}

void TestDifferentContentIsAConflict() {
  TempDir dir("fs_sink_conflict");
  WriteFile(dir.path() / "staged" / "a.root", "new");
  WriteFile(dir.path() / "site1" / "EMC" / "a.root", "old!");

  FilesystemSink sink(FilesystemSite{"site1", (dir.path() / "site1").string()});
  auto           status = sink.Deliver(Ref("EMC", "a.root"), dir.path() / "staged" / "a.root", Later());
  assert(status.code == ErrorCode::kContentConflict);
  assert(ReadFile(dir.path() / "site1" / "EMC" / "a.root") == "old!");
}

void TestExpiredDeadlineIsATransportFailure() {
  TempDir dir("fs_sink_timeout");
  WriteFile(dir.path() / "staged" / "a.root", "bytes");

  FilesystemSink sink(FilesystemSite{"site1", (dir.path() / "site1").string()});
  auto status = sink.Deliver(Ref("EMC", "a.root"), dir.path() / "staged" / "a.root", std::chrono::steady_clock::now());
  assert(status.code == ErrorCode::kTransportFailure);
  assert(!fs::exists(dir.path() / "site1" / "EMC" / "a.root"));
  assert(!fs::exists(dir.path() / "site1" / "EMC" / ".a.root.part"));
}

void TestMissingStagedFileIsAnIOFailure() {
  TempDir dir("fs_sink_missing");

  FilesystemSink sink(FilesystemSite{"site1", (dir.path() / "site1").string()});
  auto status = sink.Deliver(Ref("EMC", "a.root"), dir.path() / "staged" / "a.root", Later());
  assert(status.code == ErrorCode::kIOFailure);
}

} // namespace

int main() {
  TestCopiesIntoSubsystemDirectory();
  TestRedeliveryOfIdenticalContentSucceeds();
  TestDifferentContentIsAConflict();
  TestExpiredDeadlineIsATransportFailure();
  TestMissingStagedFileIsAnIOFailure();

  std::cout << "dqm_relay_unit_filesystem_sink: pass\n";
  return 0;
}
