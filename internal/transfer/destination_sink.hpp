#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/model/payload.hpp"
#include "internal/util/status.hpp"

namespace relay::transfer {

using Deadline = std::chrono::steady_clock::time_point;

// Bytes moved per read/write; the deadline is checked between chunks.
constexpr std::size_t kCopyChunkBytes = 1 << 20;

/*
  Transfer capability for one configured destination.

  Deliver() places the staged file at <root>/<subsystem>/<filename> and
  only makes it visible once complete. It must be idempotent: identical
  content already present is success, different content is
  kContentConflict. Remote trouble and deadline overrun are
  kTransportFailure; a staged file that cannot be read is kIOFailure.

  Called from several transfer workers at once.
*/
class DestinationSink {
 public:
  virtual ~DestinationSink() = default;

  virtual const std::string& Name() const = 0;

  virtual util::Status Deliver(const model::PayloadRef& ref, const std::filesystem::path& staged_file, Deadline deadline) = 0;
};

using DestinationSinkPtr = std::shared_ptr<DestinationSink>;

} // namespace relay::transfer
