#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/v1/ingest_service.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace relay::grpc {

class IngestServer final : public relay::v1::PayloadIngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<relay::service::IngestService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*,
                         const relay::v1::PublishRequest*,
                         relay::v1::PublishResponse*) override;

private:
  std::shared_ptr<relay::service::IngestService> service_;
};

}
