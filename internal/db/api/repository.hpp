#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/payload_record.hpp"
#include "internal/model/delivery.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A delivery row cannot outlive its payload row
  - List results are ordered by payload key, then destination name

  The DB is the source of truth for delivery progress; the staging
  directories are the source of truth for payload bytes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Staged payloads
  // ---------------------------------------------------------------------

  virtual Result UpsertPayload(Transaction&, const model::PayloadRecord&) = 0;

  virtual std::optional<model::PayloadRecord> GetPayload(Transaction&, const std::string& payload_key) = 0;

  virtual std::vector<model::PayloadRecord> ListPayloads(Transaction&) = 0;

  // Removes the payload and every delivery row that references it.
  virtual Result DeletePayload(Transaction&, const std::string& payload_key) = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  // NotFound when the payload row does not exist.
  virtual Result UpsertDelivery(Transaction&, const relay::model::DeliveryRecord&) = 0;

  virtual std::optional<relay::model::DeliveryRecord> GetDelivery(Transaction&, const std::string& payload_key,
                                                                  const std::string& destination) = 0;

  virtual std::vector<relay::model::DeliveryRecord> ListDeliveries(Transaction&, const std::string& payload_key) = 0;

  virtual std::vector<relay::model::DeliveryRecord> ListAllDeliveries(Transaction&) = 0;
};

} // namespace relay::db
