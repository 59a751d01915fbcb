#include "ingest_service.hpp"

#include <chrono>

#include "internal/ingest/receiver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::service {

using namespace relay::v1;

namespace {

[[noreturn]] void Raise(const util::Status& status) {
  switch (status.code) {
    case util::ErrorCode::kUnknownSubsystem:
    case util::ErrorCode::kInvalidArgument:
      throw util::InvalidArgument(status.message);
    case util::ErrorCode::kResourceExhausted:
      throw util::ResourceExhausted(status.message);
    default:
      throw util::Unavailable(status.message);
  }
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishResponse IngestService::Publish(const PublishRequest& req) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    observability::Metrics::Instance().RecordRequest("IngestService.Publish", ok);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        "IngestService.Publish", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  const auto result = ctx_.receiver->Receive(req.subsystem(), req.filename(), req.content(), req.run_identifier());
  if (!result.status) {
    finish(false);
    Raise(result.status);
  }

  PublishResponse resp;
  resp.set_payload_key(result.ref.Key());
  resp.set_size_bytes(result.ref.size_bytes);
  *resp.mutable_received_at() = util::ToProto(result.ref.received_at);

  finish(true);
  return resp;
}

} // namespace relay::service
