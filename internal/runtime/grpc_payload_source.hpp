#pragma once

#include <memory>
#include <string_view>

#include "internal/ingest/payload_source.hpp"
#include "internal/runtime/server.hpp"

namespace relay::runtime {

/*
  Live PayloadSource: subsystem publishers call Publish on the ingest
  service hosted by this server. Never finishes on its own.
*/
class GrpcPayloadSource final : public ingest::PayloadSource {
public:
  explicit GrpcPayloadSource(std::unique_ptr<Server> server) : server_(std::move(server)) {}

  std::string_view Name() const override {
    return "grpc";
  }

  void Start() override {
    server_->Start();
  }

  void Stop() override {
    server_->Stop();
  }

  bool Finished() const override {
    return false;
  }

private:
  std::unique_ptr<Server> server_;
};

} // namespace relay::runtime
