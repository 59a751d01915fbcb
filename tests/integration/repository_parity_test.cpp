#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/payload_record.hpp"
#include "internal/model/delivery.hpp"
#include "internal/util/time.hpp"

#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using relay::db::ErrorCode;
using relay::db::Repository;
using relay::db::memory::MemoryRepository;
using relay::db::model::PayloadRecord;
using relay::model::DeliveryRecord;
using relay::model::DeliveryState;
using relay::model::StagingLocation;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

PayloadRecord MakePayload(const std::string& subsystem, const std::string& filename) {
  PayloadRecord payload;
  payload.payload_key    = subsystem + "/" + filename;
  payload.subsystem      = subsystem;
  payload.filename       = filename;
  payload.run_identifier = "Run42";
  payload.size_bytes     = 2048;
  payload.received_at_ms = NowMs();
  return payload;
}

DeliveryRecord MakeDelivery(const std::string& key, const std::string& destination) {
  DeliveryRecord delivery;
  delivery.payload_key = key;
  delivery.destination = destination;
  delivery.updated_at  = relay::util::FromUnixMillis(NowMs());
  return delivery;
}

void VerifyPayloadLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto payload = MakePayload("EMC", "lifecycle.root");
  assert(repo.UpsertPayload(*tx, payload));

  auto read = repo.GetPayload(*tx, payload.payload_key);
  assert(read.has_value());
  assert(read->location == StagingLocation::kIncoming);
  assert(read->run_identifier == "Run42");
  assert(read->size_bytes == 2048);
  assert(!read->flagged);

  read->location = StagingLocation::kTempStorage;
  read->flagged  = true;
  assert(repo.UpsertPayload(*tx, *read));

  auto updated = repo.GetPayload(*tx, payload.payload_key);
  assert(updated->location == StagingLocation::kTempStorage);
  assert(updated->flagged);

  assert(repo.DeletePayload(*tx, payload.payload_key));
  assert(!repo.GetPayload(*tx, payload.payload_key).has_value());
  tx->Commit();
}

void VerifyDeliveryProgressAndCascade(Repository& repo) {
  auto tx = repo.Begin();

  auto payload = MakePayload("TPC", "cascade.root");
  assert(repo.UpsertPayload(*tx, payload));

  auto site1 = MakeDelivery(payload.payload_key, "site1");
  auto eos   = MakeDelivery(payload.payload_key, "EOS");
  assert(repo.UpsertDelivery(*tx, site1));
  assert(repo.UpsertDelivery(*tx, eos));

  eos.state         = DeliveryState::kFailed;
  eos.attempt_count = 2;
  eos.terminal      = true;
  eos.last_error    = "transport_failure: unreachable";
  assert(repo.UpsertDelivery(*tx, eos));

  auto read = repo.GetDelivery(*tx, payload.payload_key, "EOS");
  assert(read.has_value());
  assert(read->state == DeliveryState::kFailed);
  assert(read->attempt_count == 2);
  assert(read->terminal);
  assert(read->last_error == eos.last_error);

  // ordered by destination name within a payload
  auto listed = repo.ListDeliveries(*tx, payload.payload_key);
  assert(listed.size() == 2);
  assert(listed[0].destination == "EOS");
  assert(listed[1].destination == "site1");

  assert(repo.DeletePayload(*tx, payload.payload_key));
  assert(repo.ListDeliveries(*tx, payload.payload_key).empty());
  assert(!repo.GetDelivery(*tx, payload.payload_key, "site1").has_value());
  tx->Commit();
}

void VerifyDeliveryRequiresPayload(Repository& repo) {
  auto tx     = repo.Begin();
  auto result = repo.UpsertDelivery(*tx, MakeDelivery("HLT/orphan.root", "site1"));
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyListingOrder(Repository& repo) {
  {
    auto tx = repo.Begin();
    for (const auto& name : {"c.root", "a.root", "b.root"}) {
      auto payload = MakePayload("HLT", name);
      assert(repo.UpsertPayload(*tx, payload));
      assert(repo.UpsertDelivery(*tx, MakeDelivery(payload.payload_key, "site1")));
    }
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto payloads = repo.ListPayloads(*tx);
  assert(payloads.size() == 3);
  assert(payloads[0].payload_key == "HLT/a.root");
  assert(payloads[2].payload_key == "HLT/c.root");

  auto deliveries = repo.ListAllDeliveries(*tx);
  assert(deliveries.size() == 3);
  assert(deliveries[0].payload_key == "HLT/a.root");
  assert(deliveries[1].payload_key == "HLT/b.root");

  for (const auto& payload : payloads) {
    assert(repo.DeletePayload(*tx, payload.payload_key));
  }
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertPayload(*tx, MakePayload("EMC", "rolled_back.root")));
    tx->Rollback();
  }
  {
    // destructor rolls back an uncommitted transaction
    auto tx = repo.Begin();
    assert(repo.UpsertPayload(*tx, MakePayload("EMC", "abandoned.root")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetPayload(*tx, "EMC/rolled_back.root").has_value());
  assert(!repo.GetPayload(*tx, "EMC/abandoned.root").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx      = repo->Begin();
    auto payload = MakePayload("EMC", "durable.root");
    payload.location = StagingLocation::kTempStorage;
    assert(repo->UpsertPayload(*tx, payload));

    auto delivery          = MakeDelivery(payload.payload_key, "site1");
    delivery.state         = DeliveryState::kFailed;
    delivery.attempt_count = 1;
    assert(repo->UpsertDelivery(*tx, delivery));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetPayload(*tx, "EMC/durable.root");
  assert(p.has_value());
  assert(p->location == StagingLocation::kTempStorage);

  auto d = repo->GetDelivery(*tx, "EMC/durable.root", "site1");
  assert(d.has_value());
  assert(d->state == DeliveryState::kFailed);
  assert(d->attempt_count == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RELAY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("dqm_relay_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<relay::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<relay::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  auto repo = backend.make_repository();

  VerifyPayloadLifecycle(*repo);
  VerifyDeliveryProgressAndCascade(*repo);
  VerifyDeliveryRequiresPayload(*repo);
  VerifyListingOrder(*repo);
  VerifyRollbackDiscardsWrites(*repo);

  repo.reset();
  VerifyRestartDurability(backend);

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if RELAY_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "dqm_relay_integration_repository_parity: pass\n";
  return 0;
}
