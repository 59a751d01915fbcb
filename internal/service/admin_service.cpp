#include "admin_service.hpp"

#include <chrono>
#include <map>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/transfer/transfer_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::service {

using namespace relay::v1;
using relay::model::DeliveryState;
using relay::model::StagingLocation;

namespace {

relay::v1::DeliveryState ToProto(DeliveryState state) {
  switch (state) {
    case DeliveryState::kPending:
      return DELIVERY_STATE_PENDING;
    case DeliveryState::kInFlight:
      return DELIVERY_STATE_IN_FLIGHT;
    case DeliveryState::kDelivered:
      return DELIVERY_STATE_DELIVERED;
    case DeliveryState::kFailed:
      return DELIVERY_STATE_FAILED;
  }
  return DELIVERY_STATE_UNSPECIFIED;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(const char* route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       latency_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto resp = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, latency_ms());
    return resp;
  } catch (const std::exception& ex) {
    RELAY_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, latency_ms());
    throw;
  }
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    StatsResponse resp;
    auto          tx         = ctx_.repository->Begin();
    const auto    payloads   = ctx_.repository->ListPayloads(*tx);
    const auto    deliveries = ctx_.repository->ListAllDeliveries(*tx);
    tx->Commit();

    for (const auto& record : payloads) {
      if (record.location == StagingLocation::kIncoming) {
        resp.set_payloads_incoming(resp.payloads_incoming() + 1);
      } else {
        resp.set_payloads_temp_storage(resp.payloads_temp_storage() + 1);
      }
    }

    for (const auto& delivery : deliveries) {
      switch (delivery.state) {
        case DeliveryState::kPending:
          resp.set_deliveries_pending(resp.deliveries_pending() + 1);
          break;
        case DeliveryState::kInFlight:
          resp.set_deliveries_in_flight(resp.deliveries_in_flight() + 1);
          break;
        case DeliveryState::kDelivered:
          resp.set_deliveries_delivered(resp.deliveries_delivered() + 1);
          break;
        case DeliveryState::kFailed:
          resp.set_deliveries_failed(resp.deliveries_failed() + 1);
          break;
      }
      if (delivery.terminal) {
        resp.set_terminal_failures(resp.terminal_failures() + 1);
      }
    }
    return resp;
  });
}

ListDeliveriesResponse AdminService::ListDeliveries(const ListDeliveriesRequest& req) {
  return Instrumented("AdminService.ListDeliveries", [&] {
    ListDeliveriesResponse resp;
    auto                   tx         = ctx_.repository->Begin();
    const auto             payloads   = ctx_.repository->ListPayloads(*tx);
    const auto             deliveries = ctx_.repository->ListAllDeliveries(*tx);
    tx->Commit();

    std::map<std::string, std::string> runs;
    for (const auto& record : payloads) {
      runs.emplace(record.payload_key, record.run_identifier);
    }

    for (const auto& delivery : deliveries) {
      if (req.only_terminal() && !delivery.terminal) continue;

      auto* out = resp.add_deliveries();
      out->set_payload_key(delivery.payload_key);
      out->set_destination(delivery.destination);
      out->set_state(ToProto(delivery.state));
      out->set_attempt_count(delivery.attempt_count);
      out->set_terminal(delivery.terminal);
      out->set_last_error(delivery.last_error);
      *out->mutable_updated_at() = util::ToProto(delivery.updated_at);
      if (auto it = runs.find(delivery.payload_key); it != runs.end()) {
        out->set_run_identifier(it->second);
      }
    }
    return resp;
  });
}

ResetDeliveryResponse AdminService::ResetDelivery(const ResetDeliveryRequest& req) {
  return Instrumented("AdminService.ResetDelivery", [&] {
    if (req.payload_key().empty()) {
      throw util::InvalidArgument("payload_key is required");
    }
    ResetDeliveryResponse resp;
    resp.set_reset_count(static_cast<std::uint32_t>(ctx_.transfer->ResetDelivery(req.payload_key(), req.destination())));
    return resp;
  });
}

} // namespace relay::service
