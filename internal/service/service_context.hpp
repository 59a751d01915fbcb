#pragma once

#include <memory>

namespace relay::config { struct PipelineSettings; }
namespace relay::db { class Repository; }
namespace relay::ingest { class Receiver; }
namespace relay::staging { class StagingStore; }
namespace relay::transfer { class TransferManager; }

namespace relay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<relay::ingest::Receiver>           receiver;
  std::shared_ptr<relay::transfer::TransferManager>  transfer;
  std::shared_ptr<relay::staging::StagingStore>      staging;
  std::shared_ptr<relay::db::Repository>             repository;
};

}
