#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace relay::grpc {

class AdminServer final : public relay::v1::RelayAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<relay::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const relay::v1::StatsRequest*,
                       relay::v1::StatsResponse*) override;

  ::grpc::Status ListDeliveries(::grpc::ServerContext*,
                                const relay::v1::ListDeliveriesRequest*,
                                relay::v1::ListDeliveriesResponse*) override;

  ::grpc::Status ResetDelivery(::grpc::ServerContext*,
                               const relay::v1::ResetDeliveryRequest*,
                               relay::v1::ResetDeliveryResponse*) override;

private:
  std::shared_ptr<relay::service::AdminService> service_;
};

}
