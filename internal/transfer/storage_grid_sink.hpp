#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <arrow/filesystem/filesystem.h>

#include "internal/model/destination.hpp"
#include "internal/transfer/destination_sink.hpp"

namespace relay::transfer {

/*
  Push to long-term storage through the Arrow filesystem layer.

  The site target is a URI (s3://, hdfs://, gs://, file://) or a plain path to a
  mounted grid namespace such as an EOS FUSE mount. Objects are written
  as <root>/<subsystem>/.<filename>.part and then moved into place.

  The filesystem is resolved lazily so that an unreachable endpoint at
  startup is a retryable transfer failure, not a startup error. For s3://
  endpoints the attempt timeout also bounds every connect and request, so
  metadata calls cannot hang past it.
*/
class StorageGridSink final : public DestinationSink {
 public:
  explicit StorageGridSink(model::StorageGridSite site, std::chrono::milliseconds request_timeout = std::chrono::seconds(60));

  // Test seam: use an already constructed filesystem rooted at root_path.
  StorageGridSink(model::StorageGridSite site, std::shared_ptr<arrow::fs::FileSystem> filesystem, std::string root_path);

  const std::string& Name() const override {
    return site_.name;
  }

  util::Status Deliver(const model::PayloadRef& ref, const std::filesystem::path& staged_file, Deadline deadline) override;

 private:
  arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> FileSystem();

  model::StorageGridSite    site_;
  std::chrono::milliseconds request_timeout_{std::chrono::seconds(60)};

  std::mutex                             fs_mutex_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace relay::transfer
