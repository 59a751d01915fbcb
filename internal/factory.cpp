#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/transfer/sink_factory.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELAY_WITH_GRPC
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/runtime/grpc_payload_source.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#endif

namespace relay::factory {

using namespace relay;
using relay::observability::StringField;

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50151";

#if RELAY_WITH_GRPC
std::unique_ptr<runtime::Server> BuildServer(const relay::runtime::config::ReceiverConfig& receiver, const Application& app, bool with_ingest) {
  service::ServiceContext ctx;
  ctx.receiver   = app.receiver;
  ctx.transfer   = app.transfer;
  ctx.staging    = app.staging;
  ctx.repository = app.repository;

  std::vector<std::unique_ptr<::grpc::Service>> services;
  if (with_ingest) {
    services.push_back(std::make_unique<grpc::IngestServer>(std::make_shared<service::IngestService>(ctx)));
  }
  services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));

  const auto bind_address = receiver.bind_address().empty() ? std::string(kDefaultBindAddress) : receiver.bind_address();
  return std::make_unique<runtime::Server>(bind_address, std::move(services), static_cast<int>(receiver.max_message_bytes()));
}
#endif

} // namespace

Application::Application()                                  = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;

Application::~Application() {
  // sources feed the receiver; stop them before anything they use goes away
  if (source) source->Stop();
  if (transfer) transfer->Stop();
}

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::ConfigError("invalid configuration key 'database.sqlite.path': must not be empty");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full pipeline dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Settings and state
  // ------------------------------------------------------------------
  app.settings   = std::make_shared<const config::PipelineSettings>(config::BuildSettings(config));
  app.repository = BuildRepository(config);

  const auto& settings = *app.settings;

  app.staging = std::make_shared<staging::StagingStore>(settings.data_folder, settings.subsystems);
  app.staging->EnsureLayout();

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.receiver = std::make_shared<ingest::Receiver>(settings, app.staging, app.repository);
  app.transfer = std::make_shared<transfer::TransferManager>(settings, app.staging, app.repository, transfer::BuildSinks(settings.transfer.destinations, settings.transfer.attempt_timeout));

  if (settings.transfer.destinations.empty()) {
    RELAY_LOG_WARN("No transfer locations configured, payloads stay in staging");
  }

  // ------------------------------------------------------------------
  // Payload source: replay or live, never both
  // ------------------------------------------------------------------
  const auto& receiver = config.receiver();

  if (settings.replay.Enabled()) {
    app.source = std::make_unique<replay::ReplayEngine>(settings, app.receiver);
    if (receiver.enabled()) {
#if RELAY_WITH_GRPC
      RELAY_LOG_WARN("Replay configured, live ingest disabled; serving the admin service only");
      app.admin_server = BuildServer(receiver, app, false);
#else
      throw std::runtime_error("grpc receiver requested but not enabled at build time");
#endif
    }
  } else if (receiver.enabled()) {
#if RELAY_WITH_GRPC
    app.source = std::make_unique<runtime::GrpcPayloadSource>(BuildServer(receiver, app, true));
#else
    throw std::runtime_error("grpc receiver requested but not enabled at build time");
#endif
  } else {
    RELAY_LOG_WARN("No payload source configured, draining staging only",
                   {StringField("data_folder", settings.data_folder.string())});
  }

  return app;
}

} // namespace relay::factory
