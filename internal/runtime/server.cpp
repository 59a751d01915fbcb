#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace relay::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, int max_message_bytes)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), max_message_bytes_(max_message_bytes) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());
  if (max_message_bytes_ > 0) {
    builder.SetMaxReceiveMessageSize(max_message_bytes_);
  }

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  RELAY_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                          observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace relay::runtime
