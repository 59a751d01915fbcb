#include "internal/ingest/registration.hpp"

#include "internal/util/time.hpp"

namespace relay::ingest {

db::model::PayloadRecord ToRecord(const model::PayloadRef& ref, model::StagingLocation location) {
  db::model::PayloadRecord record;
  record.payload_key    = ref.Key();
  record.subsystem      = ref.subsystem;
  record.filename       = ref.filename;
  record.run_identifier = ref.run_identifier;
  record.size_bytes     = ref.size_bytes;
  record.received_at_ms = util::ToUnixMillis(ref.received_at);
  record.location       = location;
  return record;
}

model::PayloadRef FromRecord(const db::model::PayloadRecord& record) {
  model::PayloadRef ref;
  ref.subsystem      = record.subsystem;
  ref.filename       = record.filename;
  ref.run_identifier = record.run_identifier;
  ref.size_bytes     = record.size_bytes;
  ref.received_at    = util::FromUnixMillis(record.received_at_ms);
  return ref;
}

db::Result RegisterPending(db::Repository& repo, db::Transaction& tx, const model::PayloadRef& ref,
                           const std::vector<model::Destination>& destinations, model::StagingLocation location) {
  if (auto result = repo.UpsertPayload(tx, ToRecord(ref, location)); !result) {
    return result;
  }

  const auto now = util::Now();
  for (const auto& destination : destinations) {
    model::DeliveryRecord delivery;
    delivery.payload_key = ref.Key();
    delivery.destination = model::DestinationName(destination);
    delivery.updated_at  = now;
    if (auto result = repo.UpsertDelivery(tx, delivery); !result) {
      return result;
    }
  }
  return db::Result::Ok();
}

db::Result EnsureDeliveries(db::Repository& repo, db::Transaction& tx, const std::string& payload_key,
                            const std::vector<model::Destination>& destinations) {
  const auto now = util::Now();
  for (const auto& destination : destinations) {
    const auto& name = model::DestinationName(destination);
    if (repo.GetDelivery(tx, payload_key, name)) {
      continue;
    }
    model::DeliveryRecord delivery;
    delivery.payload_key = payload_key;
    delivery.destination = name;
    delivery.updated_at  = now;
    if (auto result = repo.UpsertDelivery(tx, delivery); !result) {
      return result;
    }
  }
  return db::Result::Ok();
}

} // namespace relay::ingest
