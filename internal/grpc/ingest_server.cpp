#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace relay::grpc {

IngestServer::IngestServer(std::shared_ptr<relay::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::Publish(::grpc::ServerContext*, const relay::v1::PublishRequest* req, relay::v1::PublishResponse* resp) {
  try {
    *resp = service_->Publish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
