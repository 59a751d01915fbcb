#pragma once

#include "relay/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace relay::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  relay::v1::StatsResponse Stats(const relay::v1::StatsRequest& req);

  relay::v1::ListDeliveriesResponse ListDeliveries(const relay::v1::ListDeliveriesRequest& req);

  // Re-drives terminally failed deliveries after an operator fixed the destination.
  relay::v1::ResetDeliveryResponse ResetDelivery(const relay::v1::ResetDeliveryRequest& req);

private:
  template <typename Fn>
  auto Instrumented(const char* route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

}
