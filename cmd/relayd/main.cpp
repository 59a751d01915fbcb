#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#if RELAY_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitExhausted = 3;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Shutdown() {
  relay::observability::ShutdownMetrics();
  relay::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: relayd <config.yaml> OR relayd --config <config.yaml>" << std::endl;
    return kExitUsage;
  }

  int exit_code = 0;

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);

    relay::observability::InitializeLogging(config);
    relay::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build pipeline (dependency graph)
    // ------------------------------------------------------------
    auto app = relay::factory::Build(config);

    const auto reconciled = app.transfer->Reconcile();
    RELAY_LOG_INFO("Staging ready", {StringField("data_folder", app.settings->data_folder.string()),
                                     IntField("tracked_adopted", static_cast<std::int64_t>(reconciled.records_adopted))});

    // Register signal handlers before starting loops to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.transfer->Start();
#if RELAY_WITH_GRPC
    if (app.admin_server) app.admin_server->Start();
#endif
    if (app.source) {
      app.source->Start();
      RELAY_LOG_INFO("Payload source started", {StringField("source", app.source->Name())});
    }

    bool source_done = false;
    while (g_running) {
      if (app.receiver->Exhausted() || app.transfer->Fatal() || (app.source && app.source->Fatal())) {
        RELAY_LOG_ERROR("Staging volume exhausted, operator intervention required",
                        {StringField("data_folder", app.settings->data_folder.string())});
        exit_code = kExitExhausted;
        break;
      }
      if (!source_done && app.source && app.source->Finished()) {
        source_done = true;
        RELAY_LOG_INFO("Payload source finished, transfer continues", {StringField("source", app.source->Name())});
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    RELAY_LOG_INFO("Shutting down relay");

    // sources first so nothing new lands while the last cycle finishes
    if (app.source) app.source->Stop();
#if RELAY_WITH_GRPC
    if (app.admin_server) app.admin_server->Stop();
#endif
    app.transfer->Stop();
  } catch (const relay::util::ResourceExhausted& e) {
    RELAY_LOG_ERROR("Staging volume exhausted", {StringField("error", e.what())});
    Shutdown();
    return kExitExhausted;
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }

  Shutdown();
  return exit_code;
}
