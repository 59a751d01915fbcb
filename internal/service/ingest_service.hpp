#pragma once

#include "relay/v1/payload.pb.h"
#include "service_context.hpp"

namespace relay::service {

/*
  Live ingest: one Publish per file, handed to the Receiver.

  Receiver outcomes are raised as util exceptions so the transport
  adapter maps them onto status codes.
*/
class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  relay::v1::PublishResponse Publish(const relay::v1::PublishRequest& req);

private:
  ServiceContext ctx_;
};

}
