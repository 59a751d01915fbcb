#pragma once

#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/destination.hpp"
#include "internal/model/payload.hpp"

namespace relay::ingest {

db::model::PayloadRecord ToRecord(const model::PayloadRef& ref, model::StagingLocation location);
model::PayloadRef        FromRecord(const db::model::PayloadRecord& record);

/*
  Writes the payload row and a fresh Pending delivery per destination,
  replacing whatever was recorded before under the same key.
*/
db::Result RegisterPending(db::Repository& repo, db::Transaction& tx, const model::PayloadRef& ref,
                           const std::vector<model::Destination>& destinations, model::StagingLocation location);

// Adds Pending rows for destinations the payload has no row for yet.
db::Result EnsureDeliveries(db::Repository& repo, db::Transaction& tx, const std::string& payload_key,
                            const std::vector<model::Destination>& destinations);

} // namespace relay::ingest
