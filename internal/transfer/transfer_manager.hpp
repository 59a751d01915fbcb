#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/staging/staging_store.hpp"
#include "internal/transfer/destination_sink.hpp"
#include "internal/transfer/transfer_scheduler.hpp"
#include "internal/transfer/transfer_worker.hpp"

namespace relay::transfer {

struct CycleReport {
  std::size_t adopted   = 0;
  std::size_t claimed   = 0;
  std::size_t attempted = 0;
  std::size_t delivered = 0;
  std::size_t failed    = 0;
  std::size_t terminal  = 0;
  std::size_t retired   = 0;
  std::size_t released  = 0;
};

struct ReconcileReport {
  std::size_t stale_temps_removed = 0;
  std::size_t records_dropped     = 0;
  std::size_t records_adopted     = 0;
  std::size_t in_flight_reverted  = 0;
};

/*
  Drains staging to every configured destination.

  Each cycle:
    apply attempts that finished since the last cycle
    adopt untracked Incoming files
    claim eligible payloads into TempStorage, mark attempts InFlight
    queue every (payload, destination) attempt on its destination's workers
    apply outcomes as they arrive, for at most one attempt timeout
    retire, release or flag a payload once none of its attempts is running

  Every destination has its own workers, so a slow destination never
  delays another. An attempt still running when the cycle ends stays
  InFlight and is applied by a later cycle; it is never queued twice.

  A failure local to one payload never aborts the cycle. A full staging
  volume stops the loop and latches Fatal().
*/
class TransferManager {
 public:
  // sinks[i] delivers to settings.transfer.destinations[i]
  TransferManager(const config::PipelineSettings& settings, std::shared_ptr<staging::StagingStore> staging,
                  std::shared_ptr<db::Repository> repository, std::vector<DestinationSinkPtr> sinks);
  ~TransferManager();

  TransferManager(const TransferManager&)            = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  // Startup only: aligns delivery records with the directory tree.
  ReconcileReport Reconcile();

  CycleReport RunCycle();

  // Attempts queued or running and not yet applied.
  std::size_t Outstanding() const;

  void Start();
  void Stop();

  bool Fatal() const {
    return fatal_.load();
  }

  // Returns failed records of payload_key to Pending with a fresh retry
  // budget. An empty destination resets every failed destination.
  // Throws util::NotFound for an untracked payload.
  std::size_t ResetDelivery(const std::string& payload_key, const std::string& destination = {});

 private:
  struct WorkItem {
    model::PayloadRef        ref;
    std::vector<std::size_t> destinations; // indices into sinks_
  };

  std::size_t           AdoptUntracked(db::Transaction& tx);
  std::vector<WorkItem> ClaimEligible(CycleReport& report);
  void                  Dispatch(const std::vector<WorkItem>& work);
  void                  ApplyCompleted(std::vector<CompletedAttempt> completed, CycleReport& report);
  void                  SettlePayload(db::Transaction& tx, const model::PayloadRef& ref, CycleReport& report);
  bool                  SupersedeFlagged(db::Transaction& tx, const db::model::PayloadRecord& record);
  std::string           InspectionReport(db::Transaction& tx, const std::string& payload_key);
  void                  PublishStagingGauges() const;

  void Loop();

  const config::PipelineSettings&        settings_;
  std::shared_ptr<staging::StagingStore> staging_;
  std::shared_ptr<db::Repository>        repository_;
  std::vector<DestinationSinkPtr>        sinks_;

  struct Lane {
    std::shared_ptr<TransferScheduler>  scheduler;
    std::unique_ptr<TransferWorkerPool> workers;
  };

  std::vector<Lane>                          lanes_; // one per destination
  std::shared_ptr<CompletionQueue>           completions_;
  std::map<std::string, std::set<std::size_t>> outstanding_; // payload key -> destination indices

  mutable std::mutex cycle_mutex_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<bool>       fatal_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
};

} // namespace relay::transfer
