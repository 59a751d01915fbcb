#pragma once

#include "relay/v1/payload.pb.h"
#include "relay/v1/ingest_service.pb.h"
#include "relay/v1/admin_service.pb.h"

#include "relay/v1/ingest_service.grpc.pb.h"
#include "relay/v1/admin_service.grpc.pb.h"
