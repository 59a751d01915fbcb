#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
