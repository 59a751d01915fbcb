#pragma once

#include "internal/model/destination.hpp"
#include "internal/transfer/destination_sink.hpp"

namespace relay::transfer {

/*
  Copies into a plain directory tree (local disk or a network mount).

  Writes <root>/<subsystem>/.<filename>.part, fsyncs, renames.
*/
class FilesystemSink final : public DestinationSink {
 public:
  explicit FilesystemSink(model::FilesystemSite site);

  const std::string& Name() const override {
    return site_.name;
  }

  util::Status Deliver(const model::PayloadRef& ref, const std::filesystem::path& staged_file, Deadline deadline) override;

 private:
  model::FilesystemSite site_;
};

} // namespace relay::transfer
