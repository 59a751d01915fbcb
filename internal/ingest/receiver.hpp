#pragma once

#include <atomic>
#include <memory>
#include <string_view>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/payload_source.hpp"
#include "internal/model/payload.hpp"
#include "internal/staging/staging_store.hpp"
#include "internal/util/status.hpp"

namespace relay::ingest {

struct ReceiveResult {
  util::Status      status;
  model::PayloadRef ref;
};

/*
  Lands inbound payloads in Incoming and registers their deliveries.

  Never retries; the source decides what to do with a failure. A full
  staging volume latches Exhausted() for the daemon to act on.
*/
class Receiver {
 public:
  Receiver(const config::PipelineSettings& settings, std::shared_ptr<staging::StagingStore> staging, std::shared_ptr<db::Repository> repository);

  ReceiveResult Receive(std::string_view subsystem, std::string_view filename, std::string_view bytes, std::string_view run_identifier = {});

  ReceiveResult Receive(const PayloadEvent& event) {
    return Receive(event.subsystem, event.filename, event.content, event.run_identifier);
  }

  bool Exhausted() const {
    return exhausted_.load();
  }

 private:
  void Register(const model::PayloadRef& ref);

  const config::PipelineSettings&        settings_;
  std::shared_ptr<staging::StagingStore> staging_;
  std::shared_ptr<db::Repository>        repository_;

  std::atomic<bool> exhausted_{false};
};

} // namespace relay::ingest
