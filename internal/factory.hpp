#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/payload_source.hpp"
#include "internal/ingest/receiver.hpp"
#include "internal/staging/staging_store.hpp"
#include "internal/transfer/transfer_manager.hpp"

namespace relay::runtime {
class Server;
}

namespace relay::factory {

/*
  Application

  Owns every long-lived component of the daemon. Components hold the
  settings by reference, so the settings object is never moved.
*/
struct Application {
  std::shared_ptr<const config::PipelineSettings> settings;

  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<staging::StagingStore>    staging;
  std::shared_ptr<ingest::Receiver>         receiver;
  std::shared_ptr<transfer::TransferManager> transfer;

  // replay engine or live ingest server; null when only draining staging
  std::unique_ptr<ingest::PayloadSource> source;

  // operator endpoint while replaying
  std::shared_ptr<runtime::Server> admin_server;

  Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;
  ~Application();
};

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire pipeline from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and sink types.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::factory
