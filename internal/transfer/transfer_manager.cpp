#include "internal/transfer/transfer_manager.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/ingest/registration.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::transfer {

using relay::model::DeliveryState;
using relay::model::StagingLocation;
using relay::observability::IntField;
using relay::observability::Metrics;
using relay::observability::StringField;

namespace {

// Throws on a failed repository write so the surrounding transaction rolls back.
void Check(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + result.message);
  }
}

} // namespace

TransferManager::TransferManager(const config::PipelineSettings& settings, std::shared_ptr<staging::StagingStore> staging,
                                 std::shared_ptr<db::Repository> repository, std::vector<DestinationSinkPtr> sinks)
    : settings_(settings),
      staging_(std::move(staging)),
      repository_(std::move(repository)),
      sinks_(std::move(sinks)),
      completions_(std::make_shared<CompletionQueue>()) {
  const auto& destinations = settings_.transfer.destinations;
  if (sinks_.size() != destinations.size()) {
    throw util::InvalidArgument("one sink per destination required");
  }
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    if (!sinks_[i] || sinks_[i]->Name() != model::DestinationName(destinations[i])) {
      throw util::InvalidArgument("sink order does not match destination order at index " + std::to_string(i));
    }
  }
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    Lane lane;
    lane.scheduler = std::make_shared<TransferScheduler>();
    lane.workers   = std::make_unique<TransferWorkerPool>(lane.scheduler, settings_.transfer.workers);
    lane.workers->Start();
    lanes_.push_back(std::move(lane));
  }
}

TransferManager::~TransferManager() {
  Stop();
  for (auto& lane : lanes_) {
    lane.workers->Stop();
  }
}

// ------------------------------------------------------------------
// Startup reconciliation
// ------------------------------------------------------------------

ReconcileReport TransferManager::Reconcile() {
  ReconcileReport report;

  staging_->EnsureLayout();
  report.stale_temps_removed = staging_->RemoveStaleTemps();

  auto tx = repository_->Begin();
  for (auto record : repository_->ListPayloads(*tx)) {
    const bool in_temp     = staging_->Exists(StagingLocation::kTempStorage, record.subsystem, record.filename);
    const bool in_incoming = staging_->Exists(StagingLocation::kIncoming, record.subsystem, record.filename);

    if (!in_temp && !in_incoming) {
      RELAY_LOG_WARN("Dropping record of payload no longer staged", {StringField("payload", record.payload_key)});
      Check(repository_->DeletePayload(*tx, record.payload_key), "delete payload");
      ++report.records_dropped;
      continue;
    }

    const auto actual = in_temp ? StagingLocation::kTempStorage : StagingLocation::kIncoming;
    if (actual != record.location) {
      record.location = actual;
      Check(repository_->UpsertPayload(*tx, record), "update payload");
    }

    for (auto delivery : repository_->ListDeliveries(*tx, record.payload_key)) {
      if (delivery.state != DeliveryState::kInFlight) continue;
      delivery.state      = DeliveryState::kPending;
      delivery.updated_at = util::Now();
      Check(repository_->UpsertDelivery(*tx, delivery), "revert in-flight delivery");
      ++report.in_flight_reverted;
    }
    Check(ingest::EnsureDeliveries(*repository_, *tx, record.payload_key, settings_.transfer.destinations), "ensure deliveries");
  }

  report.records_adopted = AdoptUntracked(*tx);
  tx->Commit();

  RELAY_LOG_INFO("Staging reconciled", {IntField("stale_temps_removed", static_cast<std::int64_t>(report.stale_temps_removed)),
                                        IntField("records_dropped", static_cast<std::int64_t>(report.records_dropped)),
                                        IntField("records_adopted", static_cast<std::int64_t>(report.records_adopted)),
                                        IntField("in_flight_reverted", static_cast<std::int64_t>(report.in_flight_reverted))});
  PublishStagingGauges();
  return report;
}

std::size_t TransferManager::AdoptUntracked(db::Transaction& tx) {
  std::size_t adopted = 0;

  // TempStorage first: when both copies exist the older staged one is tracked.
  for (const auto location : {StagingLocation::kTempStorage, StagingLocation::kIncoming}) {
    for (const auto& file : staging_->List(location)) {
      const auto key = model::PayloadKey(file.subsystem, file.filename);
      if (repository_->GetPayload(tx, key)) continue;

      model::PayloadRef ref;
      ref.subsystem      = file.subsystem;
      ref.filename       = file.filename;
      ref.run_identifier = model::FindRunIdentifier(file.filename);
      ref.size_bytes     = file.size_bytes;
      ref.received_at    = util::Now();

      Check(ingest::RegisterPending(*repository_, tx, ref, settings_.transfer.destinations, location), "register " + key);
      RELAY_LOG_INFO("Adopted untracked staged payload", {StringField("payload", key), StringField("location", model::ToString(location))});
      ++adopted;
    }
  }
  return adopted;
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

CycleReport TransferManager::RunCycle() {
  std::lock_guard cycle(cycle_mutex_);

  CycleReport report;
  if (sinks_.empty()) {
    return report;
  }

  ApplyCompleted(completions_->Drain(), report);

  Dispatch(ClaimEligible(report));

  const auto deadline = std::chrono::steady_clock::now() + settings_.transfer.attempt_timeout;
  while (!outstanding_.empty()) {
    auto completed = completions_->WaitUntil(deadline);
    if (completed.empty()) break;
    ApplyCompleted(std::move(completed), report);
  }

  PublishStagingGauges();
  if (report.attempted > 0 || report.adopted > 0) {
    RELAY_LOG_INFO("Transfer cycle finished", {IntField("claimed", static_cast<std::int64_t>(report.claimed)),
                                               IntField("attempted", static_cast<std::int64_t>(report.attempted)),
                                               IntField("delivered", static_cast<std::int64_t>(report.delivered)),
                                               IntField("failed", static_cast<std::int64_t>(report.failed)),
                                               IntField("terminal", static_cast<std::int64_t>(report.terminal)),
                                               IntField("retired", static_cast<std::int64_t>(report.retired)),
                                               IntField("released", static_cast<std::int64_t>(report.released)),
                                               IntField("still_running", static_cast<std::int64_t>(outstanding_.size()))});
  }
  return report;
}

std::size_t TransferManager::Outstanding() const {
  std::lock_guard cycle(cycle_mutex_);
  std::size_t     count = 0;
  for (const auto& [key, destinations] : outstanding_) count += destinations.size();
  return count;
}

std::vector<TransferManager::WorkItem> TransferManager::ClaimEligible(CycleReport& report) {
  std::vector<WorkItem> work;
  const auto&           destinations = settings_.transfer.destinations;

  auto tx        = repository_->Begin();
  report.adopted = AdoptUntracked(*tx);

  for (auto record : repository_->ListPayloads(*tx)) {
    Check(ingest::EnsureDeliveries(*repository_, *tx, record.payload_key, destinations), "ensure deliveries");

    const auto running = outstanding_.find(record.payload_key);
    const bool busy    = running != outstanding_.end();
    WorkItem   item;
    item.ref = ingest::FromRecord(record);

    for (std::size_t i = 0; i < destinations.size(); ++i) {
      if (busy && running->second.count(i) > 0) continue;
      auto delivery = repository_->GetDelivery(*tx, record.payload_key, model::DestinationName(destinations[i]));
      if (!delivery) continue;
      // not running here, so InFlight was interrupted
      if (delivery->state == DeliveryState::kInFlight) delivery->state = DeliveryState::kPending;
      if (model::IsRetryable(*delivery, settings_.transfer.retry_limit)) {
        item.destinations.push_back(i);
      }
    }

    if (item.destinations.empty()) {
      if (busy) continue;
      if (!record.flagged) {
        SettlePayload(*tx, item.ref, report);
      } else if (SupersedeFlagged(*tx, record)) {
        ++report.adopted;
      }
      continue;
    }

    const auto& subsystem = record.subsystem;
    const auto& filename  = record.filename;

    if (record.location == StagingLocation::kIncoming) {
      const auto claimed = staging_->Claim(subsystem, filename);
      if (!claimed && claimed.code != util::ErrorCode::kInvalidArgument) {
        if (!staging_->Exists(StagingLocation::kIncoming, subsystem, filename)) {
          RELAY_LOG_WARN("Staged file vanished, dropping record", {StringField("payload", record.payload_key)});
          Check(repository_->DeletePayload(*tx, record.payload_key), "delete payload");
        } else {
          RELAY_LOG_WARN("Could not claim payload", {StringField("payload", record.payload_key), StringField("error", claimed.message)});
        }
        continue;
      }
      // kInvalidArgument: an older copy already sits in TempStorage and is delivered first
      record.location = StagingLocation::kTempStorage;
      Check(repository_->UpsertPayload(*tx, record), "update payload");
      ++report.claimed;
    } else if (!staging_->Exists(StagingLocation::kTempStorage, subsystem, filename)) {
      if (staging_->Exists(StagingLocation::kIncoming, subsystem, filename)) {
        record.location = StagingLocation::kIncoming;
        Check(repository_->UpsertPayload(*tx, record), "update payload");
      } else {
        RELAY_LOG_WARN("Staged file vanished, dropping record", {StringField("payload", record.payload_key)});
        Check(repository_->DeletePayload(*tx, record.payload_key), "delete payload");
      }
      continue;
    }

    for (const auto index : item.destinations) {
      auto delivery       = *repository_->GetDelivery(*tx, record.payload_key, model::DestinationName(destinations[index]));
      delivery.state      = DeliveryState::kInFlight;
      delivery.updated_at = util::Now();
      Check(repository_->UpsertDelivery(*tx, delivery), "mark in flight");
    }
    work.push_back(std::move(item));
  }

  tx->Commit();
  return work;
}

// Destinations of one payload are queued in declaration order; each lane
// then runs at its own pace.
void TransferManager::Dispatch(const std::vector<WorkItem>& work) {
  for (const auto& item : work) {
    const auto staged_file = staging_->PathOf(StagingLocation::kTempStorage, item.ref.subsystem, item.ref.filename);
    auto&      running     = outstanding_[item.ref.Key()];
    for (const auto index : item.destinations) {
      TransferTask task;
      task.ref         = item.ref;
      task.staged_file = staged_file;
      task.sink        = sinks_[index];
      task.destination = index;
      task.timeout     = settings_.transfer.attempt_timeout;
      task.completions = completions_;
      running.insert(index);
      lanes_[index].scheduler->Enqueue(std::move(task));
    }
  }
}

void TransferManager::ApplyCompleted(std::vector<CompletedAttempt> completed, CycleReport& report) {
  if (completed.empty()) return;

  const auto retry_limit = settings_.transfer.retry_limit;
  auto       tx          = repository_->Begin();

  std::vector<model::PayloadRef> settled;
  for (const auto& attempt : completed) {
    const auto  key     = attempt.ref.Key();
    const auto& outcome = attempt.outcome;
    const auto& name    = sinks_[attempt.destination]->Name();

    if (auto running = outstanding_.find(key); running != outstanding_.end()) {
      running->second.erase(attempt.destination);
      if (running->second.empty()) {
        outstanding_.erase(running);
        settled.push_back(attempt.ref);
      }
    }

    auto delivery = repository_->GetDelivery(*tx, key, name);
    if (!delivery) continue;

    ++report.attempted;
    Metrics::Instance().RecordTransferAttempt(name, static_cast<bool>(outcome.status));
    Metrics::Instance().ObserveTransferDurationMs(name, outcome.duration_ms);

    if (outcome.status) {
      delivery->state = DeliveryState::kDelivered;
      delivery->last_error.clear();
      ++report.delivered;
      RELAY_LOG_INFO("Delivered payload", {StringField("payload", key), StringField("destination", name)});
    } else if (outcome.status.code == util::ErrorCode::kContentConflict) {
      delivery->state      = DeliveryState::kFailed;
      delivery->terminal   = true;
      delivery->last_error = outcome.status.message;
      ++report.terminal;
      Metrics::Instance().RecordTerminalFailure(name);
      RELAY_LOG_ERROR("Destination holds different content, not retrying",
                      {StringField("payload", key), StringField("destination", name), StringField("error", outcome.status.message)});
    } else {
      delivery->state      = DeliveryState::kFailed;
      delivery->last_error = std::string(util::ToString(outcome.status.code)) + ": " + outcome.status.message;
      ++delivery->attempt_count;
      if (delivery->attempt_count >= retry_limit) {
        delivery->terminal = true;
        ++report.terminal;
        Metrics::Instance().RecordTerminalFailure(name);
        RELAY_LOG_ERROR("Transfer retry limit reached",
                        {StringField("payload", key), StringField("destination", name),
                         IntField("attempts", delivery->attempt_count), StringField("error", delivery->last_error)});
      } else {
        ++report.failed;
        RELAY_LOG_WARN("Transfer attempt failed",
                       {StringField("payload", key), StringField("destination", name),
                        IntField("attempts", delivery->attempt_count), StringField("error", delivery->last_error)});
      }
    }

    delivery->updated_at = util::Now();
    Check(repository_->UpsertDelivery(*tx, *delivery), "update delivery");
  }

  for (const auto& ref : settled) {
    if (repository_->GetPayload(*tx, ref.Key())) {
      SettlePayload(*tx, ref, report);
    }
  }

  tx->Commit();
}

void TransferManager::SettlePayload(db::Transaction& tx, const model::PayloadRef& ref, CycleReport& report) {
  const auto key = ref.Key();

  bool all_delivered = true;
  bool any_delivered = false;
  bool any_retryable = false;
  for (const auto& destination : settings_.transfer.destinations) {
    auto delivery = repository_->GetDelivery(tx, key, model::DestinationName(destination));
    if (!delivery) {
      all_delivered = false;
      any_retryable = true;
      continue;
    }
    const bool delivered = delivery->state == DeliveryState::kDelivered;
    all_delivered        = all_delivered && delivered;
    any_delivered        = any_delivered || delivered;
    any_retryable        = any_retryable || model::IsRetryable(*delivery, settings_.transfer.retry_limit);
  }

  if (all_delivered) {
    if (auto retired = staging_->Retire(ref.subsystem, ref.filename); !retired) {
      RELAY_LOG_ERROR("Could not retire delivered payload", {StringField("payload", key), StringField("error", retired.message)});
      return;
    }
    Check(repository_->DeletePayload(tx, key), "delete payload");
    ++report.retired;
    RELAY_LOG_INFO("Payload delivered to every destination", {StringField("payload", key)});
    return;
  }

  if (any_retryable) {
    if (any_delivered) {
      return; // partially delivered payloads stay claimed
    }
    const bool newer_copy = staging_->Exists(StagingLocation::kIncoming, ref.subsystem, ref.filename);
    if (auto released = staging_->Release(ref.subsystem, ref.filename); !released) {
      RELAY_LOG_WARN("Could not release payload", {StringField("payload", key), StringField("error", released.message)});
      return;
    }
    if (newer_copy) {
      // the newer copy is adopted with fresh records next cycle
      Check(repository_->DeletePayload(tx, key), "delete payload");
    } else if (auto record = repository_->GetPayload(tx, key)) {
      record->location = StagingLocation::kIncoming;
      Check(repository_->UpsertPayload(tx, *record), "update payload");
    }
    ++report.released;
    return;
  }

  auto record = repository_->GetPayload(tx, key);
  if (!record || record->flagged) {
    return;
  }
  if (auto flagged = staging_->FlagForInspection(ref.subsystem, ref.filename, InspectionReport(tx, key)); !flagged) {
    RELAY_LOG_ERROR("Could not write inspection marker", {StringField("payload", key), StringField("error", flagged.message)});
    return;
  }
  record->flagged = true;
  Check(repository_->UpsertPayload(tx, *record), "flag payload");
  RELAY_LOG_ERROR("Payload left in staging for inspection",
                  {StringField("payload", key), StringField("marker", staging_->MarkerPath(ref.subsystem, ref.filename).string())});
}

// A newer copy waits in Incoming behind a flagged one: the flagged copy is
// set aside with its marker and the newer copy is tracked in its place.
bool TransferManager::SupersedeFlagged(db::Transaction& tx, const db::model::PayloadRecord& record) {
  if (!staging_->Exists(StagingLocation::kIncoming, record.subsystem, record.filename)) {
    return false;
  }
  if (auto set_aside = staging_->SetAside(record.subsystem, record.filename); !set_aside) {
    RELAY_LOG_ERROR("Could not set flagged payload aside, newer copy keeps waiting",
                    {StringField("payload", record.payload_key), StringField("error", set_aside.message)});
    return false;
  }

  auto            ref = ingest::FromRecord(record);
  std::error_code ec;
  ref.size_bytes  = std::filesystem::file_size(staging_->PathOf(StagingLocation::kIncoming, record.subsystem, record.filename), ec);
  ref.received_at = util::Now();
  if (ec) ref.size_bytes = 0;
  Check(ingest::RegisterPending(*repository_, tx, ref, settings_.transfer.destinations, StagingLocation::kIncoming), "register " + record.payload_key);
  RELAY_LOG_WARN("Newer copy replaces payload flagged for inspection",
                 {StringField("payload", record.payload_key), StringField("set_aside", staging_->InspectionDir(record.subsystem).string())});
  return true;
}

std::string TransferManager::InspectionReport(db::Transaction& tx, const std::string& payload_key) {
  std::ostringstream out;
  out << "payload " << payload_key << "\n";
  for (const auto& delivery : repository_->ListDeliveries(tx, payload_key)) {
    out << delivery.destination << " state=" << model::ToString(delivery.state) << " attempts=" << delivery.attempt_count
        << " terminal=" << (delivery.terminal ? "true" : "false");
    if (!delivery.last_error.empty()) {
      out << " error=" << delivery.last_error;
    }
    out << "\n";
  }
  return out.str();
}

void TransferManager::PublishStagingGauges() const {
  Metrics::Instance().SetStagedPayloads(model::ToString(StagingLocation::kIncoming), staging_->List(StagingLocation::kIncoming).size());
  Metrics::Instance().SetStagedPayloads(model::ToString(StagingLocation::kTempStorage), staging_->List(StagingLocation::kTempStorage).size());
}

// ------------------------------------------------------------------
// Operator reset
// ------------------------------------------------------------------

std::size_t TransferManager::ResetDelivery(const std::string& payload_key, const std::string& destination) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPayload(*tx, payload_key);
  if (!record) {
    throw util::NotFound("payload not tracked: " + payload_key);
  }

  std::size_t reset   = 0;
  bool        matched = destination.empty();
  for (auto delivery : repository_->ListDeliveries(*tx, payload_key)) {
    if (!destination.empty() && delivery.destination != destination) continue;
    matched = true;
    if (delivery.state != DeliveryState::kFailed) continue;

    delivery.state         = DeliveryState::kPending;
    delivery.attempt_count = 0;
    delivery.terminal      = false;
    delivery.last_error.clear();
    delivery.updated_at = util::Now();
    Check(repository_->UpsertDelivery(*tx, delivery), "reset delivery");
    ++reset;
  }
  if (!matched) {
    throw util::NotFound("no delivery of " + payload_key + " to " + destination);
  }

  if (reset > 0 && record->flagged) {
    record->flagged = false;
    Check(repository_->UpsertPayload(*tx, *record), "unflag payload");
  }
  tx->Commit();

  if (reset > 0) {
    staging_->ClearInspection(record->subsystem, record->filename);
    RELAY_LOG_INFO("Deliveries reset by operator", {StringField("payload", payload_key), IntField("reset", static_cast<std::int64_t>(reset))});
  }
  return reset;
}

// ------------------------------------------------------------------
// Loop
// ------------------------------------------------------------------

void TransferManager::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&TransferManager::Loop, this);
}

void TransferManager::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void TransferManager::Loop() {
  while (running_) {
    try {
      RunCycle();
    } catch (const util::ResourceExhausted& e) {
      fatal_ = true;
      RELAY_LOG_ERROR("Staging volume exhausted, transfer stopped", {StringField("error", e.what())});
      break;
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("Transfer cycle failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, settings_.transfer.cycle_interval, [&] { return !running_.load(); });
  }
}

} // namespace relay::transfer
