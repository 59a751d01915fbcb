#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/ingest/receiver.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/staging/staging_store.hpp"
#include "internal/transfer/transfer_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using relay::testing::MakeSettings;
using relay::testing::TempDir;

void TestExceptionMapping() {
  using relay::grpc::ToStatus;
  assert(ToStatus(relay::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(relay::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(relay::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(relay::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(relay::util::ConfigError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(relay::util::NotFound("payload gone")).error_message() == "payload gone");
}

void TestServersTranslateServiceErrors() {
  TempDir    dir("grpc_status");
  const auto settings = MakeSettings(dir.path() / "data");

  relay::service::ServiceContext ctx;
  ctx.staging    = std::make_shared<relay::staging::StagingStore>(settings.data_folder, settings.subsystems);
  ctx.repository = std::make_shared<relay::db::memory::MemoryRepository>();
  ctx.staging->EnsureLayout();
  ctx.receiver = std::make_shared<relay::ingest::Receiver>(settings, ctx.staging, ctx.repository);
  ctx.transfer = std::make_shared<relay::transfer::TransferManager>(settings, ctx.staging, ctx.repository,
                                                                    std::vector<relay::transfer::DestinationSinkPtr>{});

  relay::grpc::IngestServer ingest(std::make_shared<relay::service::IngestService>(ctx));
  relay::grpc::AdminServer  admin(std::make_shared<relay::service::AdminService>(ctx));

  {
    relay::v1::PublishRequest  req;
    relay::v1::PublishResponse resp;
    ::grpc::ServerContext      grpc_ctx;
    req.set_subsystem("ABC");
    req.set_filename("a.root");
    assert(ingest.Publish(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    relay::v1::PublishRequest  req;
    relay::v1::PublishResponse resp;
    ::grpc::ServerContext      grpc_ctx;
    req.set_subsystem("HLT");
    req.set_filename("a.root");
    req.set_content("abc");
    assert(ingest.Publish(&grpc_ctx, &req, &resp).ok());
    assert(resp.payload_key() == "HLT/a.root");
  }
  {
    relay::v1::ResetDeliveryRequest  req;
    relay::v1::ResetDeliveryResponse resp;
    ::grpc::ServerContext            grpc_ctx;
    req.set_payload_key("HLT/missing.root");
    assert(admin.ResetDelivery(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    relay::v1::StatsRequest  req;
    relay::v1::StatsResponse resp;
    ::grpc::ServerContext    grpc_ctx;
    assert(admin.Stats(&grpc_ctx, &req, &resp).ok());
    assert(resp.payloads_incoming() == 1);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestServersTranslateServiceErrors();

  std::cout << "dqm_relay_unit_grpc_status: pass\n";
  return 0;
}
