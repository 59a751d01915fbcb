#include "internal/staging/staging_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using relay::model::PayloadRef;
using relay::model::StagingLocation;
using relay::staging::StagingStore;
using relay::testing::ReadFile;
using relay::testing::TempDir;
using relay::testing::WriteFile;
using relay::util::ErrorCode;

PayloadRef Ref(const std::string& subsystem, const std::string& filename) {
  PayloadRef ref;
  ref.subsystem = subsystem;
  ref.filename  = filename;
  return ref;
}

void TestLayoutMatchesHistoricalTree() {
  TempDir      dir("staging_layout");
  StagingStore store(dir.path(), {"EMC", "TPC"});
  store.EnsureLayout();

  assert(fs::is_directory(dir.path() / "EMC" / "Incoming"));
  assert(fs::is_directory(dir.path() / "TPC" / "Incoming"));
  assert(fs::is_directory(dir.path() / "tempStorage" / "EMC"));
  assert(store.PathOf(StagingLocation::kIncoming, "EMC", "a.root") == dir.path() / "EMC" / "Incoming" / "a.root");
  assert(store.PathOf(StagingLocation::kTempStorage, "EMC", "a.root") == dir.path() / "tempStorage" / "EMC" / "a.root");
  assert(store.MarkerPath("EMC", "a.root") == dir.path() / "tempStorage" / "EMC" / ".a.root.failed");
}

void TestAdmitPublishesCompleteFileOnly() {
  TempDir      dir("staging_admit");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();

  const auto status = store.Admit(Ref("EMC", "EMChistos_123.root"), "histogram-bytes");
  assert(status);
  assert(ReadFile(store.PathOf(StagingLocation::kIncoming, "EMC", "EMChistos_123.root")) == "histogram-bytes");
  assert(!fs::exists(dir.path() / "EMC" / "Incoming" / ".EMChistos_123.root.tmp"));

  const auto listed = store.List(StagingLocation::kIncoming);
  assert(listed.size() == 1);
  assert(listed[0].subsystem == "EMC");
  assert(listed[0].filename == "EMChistos_123.root");
  assert(listed[0].size_bytes == std::string("histogram-bytes").size());
}

void TestAdmitRejectsPathLikeNames() {
  TempDir      dir("staging_names");
  StagingStore store(dir.path(), {"EMC"});

  for (const auto* name : {"../escape.root", ".hidden", "", "a/b"}) {
    bool threw = false;
    try {
      (void)store.Admit(Ref("EMC", name), "x");
    } catch (const relay::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestClaimAndReleaseKeepExactlyOneCopy() {
  TempDir      dir("staging_claim");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();
  assert(store.Admit(Ref("EMC", "f.root"), "v1"));

  assert(store.Claim("EMC", "f.root"));
  assert(!store.Exists(StagingLocation::kIncoming, "EMC", "f.root"));
  assert(store.Exists(StagingLocation::kTempStorage, "EMC", "f.root"));

  // already claimed counts as success
  assert(store.Claim("EMC", "f.root"));

  assert(store.Release("EMC", "f.root"));
  assert(store.Exists(StagingLocation::kIncoming, "EMC", "f.root"));
  assert(!store.Exists(StagingLocation::kTempStorage, "EMC", "f.root"));

  const auto missing = store.Claim("EMC", "never.root");
  assert(!missing);
  assert(missing.code == ErrorCode::kIOFailure);
}

void TestNewerCopyWaitsForOlderOne() {
  TempDir      dir("staging_newer");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();
  assert(store.Admit(Ref("EMC", "f.root"), "old"));
  assert(store.Claim("EMC", "f.root"));
  assert(store.Admit(Ref("EMC", "f.root"), "new"));

  const auto blocked = store.Claim("EMC", "f.root");
  assert(!blocked);
  assert(blocked.code == ErrorCode::kInvalidArgument);

  // releasing the older copy discards it in favour of the newer one
  assert(store.Release("EMC", "f.root"));
  assert(!store.Exists(StagingLocation::kTempStorage, "EMC", "f.root"));
  assert(ReadFile(store.PathOf(StagingLocation::kIncoming, "EMC", "f.root")) == "new");
}

void TestInspectionMarkerLifecycle() {
  TempDir      dir("staging_marker");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();
  assert(store.Admit(Ref("EMC", "f.root"), "x"));
  assert(store.Claim("EMC", "f.root"));

  assert(store.FlagForInspection("EMC", "f.root", "site1 attempts=2"));
  assert(store.IsFlagged("EMC", "f.root"));
  assert(ReadFile(store.MarkerPath("EMC", "f.root")) == "site1 attempts=2");

  // markers are hidden from scans
  assert(store.List(StagingLocation::kTempStorage).size() == 1);

  store.ClearInspection("EMC", "f.root");
  assert(!store.IsFlagged("EMC", "f.root"));

  assert(store.FlagForInspection("EMC", "f.root", "again"));
  assert(store.Retire("EMC", "f.root"));
  assert(!store.IsFlagged("EMC", "f.root"));
  assert(!store.Exists(StagingLocation::kTempStorage, "EMC", "f.root"));
}

void TestSetAsideFreesTheNameAndKeepsEarlierCopies() {
  TempDir      dir("staging_set_aside");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();
  assert(store.InspectionDir("EMC") == dir.path() / "tempStorage" / ".inspection" / "EMC");

  for (const auto* content : {"first", "second"}) {
    assert(store.Admit(Ref("EMC", "f.root"), content));
    assert(store.Claim("EMC", "f.root"));
    assert(store.FlagForInspection("EMC", "f.root", content));
    assert(store.SetAside("EMC", "f.root"));
    assert(!store.Exists(StagingLocation::kTempStorage, "EMC", "f.root"));
    assert(!store.IsFlagged("EMC", "f.root"));
  }

  const auto aside = store.InspectionDir("EMC");
  assert(ReadFile(aside / "f.root") == "first");
  assert(ReadFile(aside / ".f.root.failed") == "first");
  assert(ReadFile(aside / "f.root.1") == "second");
  assert(ReadFile(aside / ".f.root.1.failed") == "second");

  // set-aside copies are invisible to scans
  assert(store.List(StagingLocation::kTempStorage).empty());
  assert(!store.SetAside("EMC", "f.root"));
}

void TestStaleReceiptFilesAreRemoved() {
  TempDir      dir("staging_stale");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();

  WriteFile(dir.path() / "EMC" / "Incoming" / ".partial.root.tmp", "half");
  WriteFile(dir.path() / "tempStorage" / "EMC" / ".marker.root.failed.tmp", "half");
  WriteFile(dir.path() / "EMC" / "Incoming" / "kept.root", "whole");

  assert(store.RemoveStaleTemps() == 2);
  assert(fs::exists(dir.path() / "EMC" / "Incoming" / "kept.root"));
  assert(store.List(StagingLocation::kIncoming).size() == 1);
}

void TestUnconfiguredSubsystemDirectoriesAreIgnored() {
  TempDir      dir("staging_unconfigured");
  StagingStore store(dir.path(), {"EMC"});
  store.EnsureLayout();

  WriteFile(dir.path() / "XYZ" / "Incoming" / "stray.root", "x");
  assert(store.List(StagingLocation::kIncoming).empty());
}

} // namespace

int main() {
  TestLayoutMatchesHistoricalTree();
  TestAdmitPublishesCompleteFileOnly();
  TestAdmitRejectsPathLikeNames();
  TestClaimAndReleaseKeepExactlyOneCopy();
  TestNewerCopyWaitsForOlderOne();
  TestInspectionMarkerLifecycle();
  TestSetAsideFreesTheNameAndKeepsEarlierCopies();
  TestStaleReceiptFilesAreRemoved();
  TestUnconfiguredSubsystemDirectoriesAreIgnored();

  std::cout << "dqm_relay_unit_staging_store: pass\n";
  return 0;
}
