#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/receiver.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/staging/staging_store.hpp"
#include "internal/transfer/transfer_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using relay::model::FilesystemSite;
using relay::model::StorageGridSite;
using relay::testing::MakeSettings;
using relay::testing::ScriptedSink;
using relay::testing::TempDir;
using relay::util::ErrorCode;

struct Fixture {
  explicit Fixture(const std::string& name)
      : dir(name),
        settings(MakeSettings(dir.path() / "data", {FilesystemSite{"site1", "/site1"}, StorageGridSite{"EOS", "/eos"}}, 2)),
        site1(std::make_shared<ScriptedSink>("site1")),
        eos(std::make_shared<ScriptedSink>("EOS", std::vector<ErrorCode>{ErrorCode::kContentConflict})) {
    ctx.staging    = std::make_shared<relay::staging::StagingStore>(settings.data_folder, settings.subsystems);
    ctx.repository = std::make_shared<relay::db::memory::MemoryRepository>();
    ctx.staging->EnsureLayout();
    ctx.receiver = std::make_shared<relay::ingest::Receiver>(settings, ctx.staging, ctx.repository);
    ctx.transfer = std::make_shared<relay::transfer::TransferManager>(settings, ctx.staging, ctx.repository,
                                                                      std::vector<relay::transfer::DestinationSinkPtr>{site1, eos});
  }

  TempDir                               dir;
  relay::config::PipelineSettings       settings;
  std::shared_ptr<ScriptedSink>         site1;
  std::shared_ptr<ScriptedSink>         eos;
  relay::service::ServiceContext        ctx;
};

relay::v1::PublishRequest MakePublish(const std::string& subsystem, const std::string& filename) {
  relay::v1::PublishRequest req;
  req.set_subsystem(subsystem);
  req.set_filename(filename);
  req.set_content("histograms");
  req.set_run_identifier("Run42");
  return req;
}

void TestPublishStagesPayload() {
  Fixture                        f("svc_publish");
  relay::service::IngestService ingest(f.ctx);

  const auto resp = ingest.Publish(MakePublish("EMC", "EMChistos_1.root"));
  assert(resp.payload_key() == "EMC/EMChistos_1.root");
  assert(resp.size_bytes() == 10);
  assert(f.ctx.staging->Exists(relay::model::StagingLocation::kIncoming, "EMC", "EMChistos_1.root"));
}

void TestPublishRejectionsRaiseInvalidArgument() {
  Fixture                        f("svc_publish_invalid");
  relay::service::IngestService ingest(f.ctx);

  for (const auto& req : {MakePublish("ABC", "a.root"), MakePublish("EMC", "../a.root"), MakePublish("EMC", "")}) {
    bool threw = false;
    try {
      (void)ingest.Publish(req);
    } catch (const relay::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestStatsAndListingFollowDeliveryProgress() {
  Fixture                        f("svc_stats");
  relay::service::IngestService ingest(f.ctx);
  relay::service::AdminService  admin(f.ctx);

  (void)ingest.Publish(MakePublish("EMC", "a.root"));
  (void)ingest.Publish(MakePublish("TPC", "b.root"));

  auto stats = admin.Stats({});
  assert(stats.payloads_incoming() == 2);
  assert(stats.deliveries_pending() == 4);

  // EOS reports a content conflict for the first payload attempted
  (void)f.ctx.transfer->RunCycle();

  stats = admin.Stats({});
  assert(stats.payloads_temp_storage() == 1);
  assert(stats.terminal_failures() == 1);
  assert(stats.deliveries_failed() == 1);
  assert(stats.deliveries_delivered() == 1);

  relay::v1::ListDeliveriesRequest only_terminal;
  only_terminal.set_only_terminal(true);
  const auto listed = admin.ListDeliveries(only_terminal);
  assert(listed.deliveries_size() == 1);
  assert(listed.deliveries(0).destination() == "EOS");
  assert(listed.deliveries(0).state() == relay::v1::DELIVERY_STATE_FAILED);
  assert(listed.deliveries(0).run_identifier() == "Run42");

  relay::v1::ResetDeliveryRequest reset;
  reset.set_payload_key(listed.deliveries(0).payload_key());
  assert(admin.ResetDelivery(reset).reset_count() == 1);

  (void)f.ctx.transfer->RunCycle();
  stats = admin.Stats({});
  assert(stats.payloads_incoming() + stats.payloads_temp_storage() == 0);
}

void TestResetValidatesRequest() {
  Fixture                       f("svc_reset");
  relay::service::AdminService admin(f.ctx);

  bool threw = false;
  try {
    (void)admin.ResetDelivery({});
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  relay::v1::ResetDeliveryRequest reset;
  reset.set_payload_key("EMC/missing.root");
  threw = false;
  try {
    (void)admin.ResetDelivery(reset);
  } catch (const relay::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPublishStagesPayload();
  TestPublishRejectionsRaiseInvalidArgument();
  TestStatsAndListingFollowDeliveryProgress();
  TestResetValidatesRequest();

  std::cout << "dqm_relay_unit_admin_service: pass\n";
  return 0;
}
