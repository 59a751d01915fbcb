#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace relay::grpc {

AdminServer::AdminServer(std::shared_ptr<relay::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const relay::v1::StatsRequest* req, relay::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListDeliveries(::grpc::ServerContext*, const relay::v1::ListDeliveriesRequest* req,
                                           relay::v1::ListDeliveriesResponse* resp) {
  try {
    *resp = service_->ListDeliveries(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ResetDelivery(::grpc::ServerContext*, const relay::v1::ResetDeliveryRequest* req,
                                          relay::v1::ResetDeliveryResponse* resp) {
  try {
    *resp = service_->ResetDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
