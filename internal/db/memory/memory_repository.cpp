#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Payloads
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPayload(Transaction& t, const model::PayloadRecord& r) {
  if (r.payload_key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty payload key");
  TX(t).Mutable().payloads[r.payload_key] = r;
  return Result::Ok();
}

std::optional<model::PayloadRecord> MemoryRepository::GetPayload(Transaction& t, const std::string& payload_key) {
  const auto& s  = TX(t).View();
  auto        it = s.payloads.find(payload_key);
  if (it == s.payloads.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PayloadRecord> MemoryRepository::ListPayloads(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::PayloadRecord> records;
  records.reserve(s.payloads.size());
  for (const auto& [_, record] : s.payloads) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeletePayload(Transaction& t, const std::string& payload_key) {
  auto& s = TX(t).Mutable();
  s.payloads.erase(payload_key);
  auto it = s.deliveries.lower_bound({payload_key, std::string{}});
  while (it != s.deliveries.end() && it->first.first == payload_key) {
    it = s.deliveries.erase(it);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDelivery(Transaction& t, const relay::model::DeliveryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.payloads.contains(r.payload_key)) return Result::Err(ErrorCode::NotFound, "payload not staged: " + r.payload_key);
  s.deliveries[{r.payload_key, r.destination}] = r;
  return Result::Ok();
}

std::optional<relay::model::DeliveryRecord> MemoryRepository::GetDelivery(Transaction& t, const std::string& payload_key,
                                                                          const std::string& destination) {
  const auto& s  = TX(t).View();
  auto        it = s.deliveries.find({payload_key, destination});
  if (it == s.deliveries.end()) return std::nullopt;
  return it->second;
}

std::vector<relay::model::DeliveryRecord> MemoryRepository::ListDeliveries(Transaction& t, const std::string& payload_key) {
  const auto&                               s = TX(t).View();
  std::vector<relay::model::DeliveryRecord> out;
  for (auto it = s.deliveries.lower_bound({payload_key, std::string{}}); it != s.deliveries.end() && it->first.first == payload_key; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<relay::model::DeliveryRecord> MemoryRepository::ListAllDeliveries(Transaction& t) {
  const auto&                               s = TX(t).View();
  std::vector<relay::model::DeliveryRecord> out;
  out.reserve(s.deliveries.size());
  for (const auto& [_, record] : s.deliveries) {
    out.push_back(record);
  }
  return out;
}

} // namespace relay::db::memory
