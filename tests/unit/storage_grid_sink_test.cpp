#include "internal/transfer/storage_grid_sink.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using relay::model::PayloadRef;
using relay::model::StorageGridSite;
using relay::testing::ReadFile;
using relay::testing::TempDir;
using relay::testing::WriteFile;
using relay::transfer::StorageGridSink;
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

void TestUploadThroughInjectedFilesystem() {
  TempDir dir("grid_sink_upload");
  WriteFile(dir.path() / "staged" / "h.root", "grid bytes");
  const auto root = (dir.path() / "eos").string();

  StorageGridSink sink(StorageGridSite{"EOS", "/eos"}, std::make_shared<arrow::fs::LocalFileSystem>(), root);
  assert(sink.Name() == "EOS");

  assert(sink.Deliver(Ref("HLT", "h.root"), dir.path() / "staged" / "h.root", Later()));
  assert(ReadFile(dir.path() / "eos" / "HLT" / "h.root") == "grid bytes");
  assert(!fs::exists(dir.path() / "eos" / "HLT" / ".h.root.part"));

  // idempotent for identical content
  assert(sink.Deliver(Ref("HLT", "h.root"), dir.path() / "staged" / "h.root", Later()));

  WriteFile(dir.path() / "staged" / "h.root", "changed bytes");
  assert(sink.Deliver(Ref("HLT", "h.root"), dir.path() / "staged" / "h.root", Later()).code == ErrorCode::kContentConflict);
}

void TestPlainPathSpecResolvesLazily() {
  TempDir dir("grid_sink_path");
  WriteFile(dir.path() / "staged" / "h.root", "x");

  StorageGridSink sink(StorageGridSite{"EOS", (dir.path() / "mount").string()});
  assert(sink.Deliver(Ref("TPC", "h.root"), dir.path() / "staged" / "h.root", Later()));
  assert(ReadFile(dir.path() / "mount" / "TPC" / "h.root") == "x");
}

void TestUnreachableEndpointIsRetryable() {
  TempDir dir("grid_sink_bad");
  WriteFile(dir.path() / "staged" / "h.root", "x");

  StorageGridSink sink(StorageGridSite{"EOS", "nosuchscheme://host/path"});
  assert(sink.Deliver(Ref("TPC", "h.root"), dir.path() / "staged" / "h.root", Later()).code == ErrorCode::kTransportFailure);
}

} // namespace

int main() {
  TestUploadThroughInjectedFilesystem();
  TestPlainPathSpecResolvesLazily();
  TestUnreachableEndpointIsRetryable();

  std::cout << "dqm_relay_unit_storage_grid_sink: pass\n";
  return 0;
}
