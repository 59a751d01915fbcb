#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertPayload(Transaction&, const model::PayloadRecord&) override;
  std::optional<model::PayloadRecord> GetPayload(Transaction&, const std::string&) override;
  std::vector<model::PayloadRecord> ListPayloads(Transaction&) override;
  Result DeletePayload(Transaction&, const std::string&) override;

  Result UpsertDelivery(Transaction&, const relay::model::DeliveryRecord&) override;
  std::optional<relay::model::DeliveryRecord> GetDelivery(Transaction&, const std::string& payload_key,
                                                          const std::string& destination) override;
  std::vector<relay::model::DeliveryRecord> ListDeliveries(Transaction&, const std::string& payload_key) override;
  std::vector<relay::model::DeliveryRecord> ListAllDeliveries(Transaction&) override;

private:
  friend class MemoryTransaction;

  using DeliveryKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::PayloadRecord>          payloads;
    std::map<DeliveryKey, relay::model::DeliveryRecord> deliveries;
  };

  // held by the open transaction for its whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
};

}
